//
// smb1negotiate.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB1 multi-protocol negotiate request.
//

#include "smb1negotiate.hpp"

void NetSmb1Dialect::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(BufferFormat, SMB1_DIALECT_BUFFER_FORMAT);
  BINDFIELD(Name);
}

void NetSmb1NegotiateCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(Protocol, SMB1_PROTOCOL_ID);
  BINDCONSTANT(Command, SMB1_COM_NEGOTIATE);
  BINDFIELD(Status);
  BINDFIELD(Flags);
  BINDFIELD(Flags2);
  BINDCONSTANT(PidHigh, 0);
  BINDFIELD(SecurityFeatures);
  BINDRESERVED(Reserved);
  BINDFIELD(Tid);
  BINDCONSTANT(PidLow, 1);
  BINDRESERVED(Uid);
  BINDRESERVED(Mid);
  BINDCONSTANT(WordCount, 0);
  BINDMARKER(ByteCount);
  BINDPAYLOAD(Dialects).sized_by(ByteCount);
}

void NetSmb1NegotiateCmd::set_multi_protocol_defaults()
{
  Status = 0;
  Flags = 0x18;
  Flags2 = 0xc853;
  Dialects.wire_clear();
  add_dialect(SMB1_DIALECT_NT_LM_012);
  add_dialect(SMB1_DIALECT_SMB2_002);
  add_dialect(SMB1_DIALECT_SMB2_WILD);
}

bool NetSmb1NegotiateCmd::offers_dialect(const char *name) const
{
  for (size_t i = 0; i < Dialects.size(); i++)
    if (Dialects[i].Name == name)
      return true;
  return false;
}

void NetSmb1NegotiateCmd::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB1_NEGOTIATE dialects: %d\n", (int) Dialects.size());
  for (size_t i = 0; i < Dialects.size(); i++)
    diag_printf_fn(DIAG_INFORMATIONAL,"   dialect %s\n", Dialects[i].Name().c_str());
}

bool smb2wire_is_smb1_message(const byte *bytes, dword length)
{
  return length >= 4 && bytes[0] == 0xFF && bytes[1] == 'S' && bytes[2] == 'M' && bytes[3] == 'B';
}
