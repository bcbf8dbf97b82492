//
// smb1negotiate.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB1 SMB_COM_NEGOTIATE request, only as the opening of a multi-protocol
//  negotiate. The dialect list fills ByteCount bytes, each dialect a 0x02
//  buffer format byte and a null terminated name.
//
#ifndef include_smb1negotiate
#define include_smb1negotiate

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"
#include "wiresizedstring.hpp"

#define SMB1_PROTOCOL_ID        0x424D53FF      // "\xffSMB" read as a little endian dword
#define SMB1_COM_NEGOTIATE      0x72
#define SMB1_DIALECT_BUFFER_FORMAT 0x02

#define SMB1_DIALECT_NT_LM_012  "NT LM 0.12"
#define SMB1_DIALECT_SMB2_002   "SMB 2.002"
#define SMB1_DIALECT_SMB2_WILD  "SMB 2.???"

class NetSmb1Dialect : public NetWireStruct {
public:
  NetSmb1Dialect() {}
  NetSmb1Dialect(const char *name) { Name = name; }
  NetWirebyte BufferFormat; // 2
  NetWireAsciizString Name;
  const char *command_name() { return "SMB1 dialect"; }
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb1NegotiateCmd : public NetWireStruct {
public:
  NetSmb1NegotiateCmd() { objectsize=35; Tid = 0xffff; }
  NetWiredword Protocol;          // 0xFF 'S' 'M' 'B'
  NetWirebyte  Command;           // 0x72
  NetWiredword Status;
  NetWirebyte  Flags;
  NetWireword  Flags2;
  NetWireword  PidHigh;
  NetWireFixedBlob<8> SecurityFeatures;
  NetWireword  Reserved;
  NetWireword  Tid;
  NetWireword  PidLow;            // 1
  NetWireword  Uid;
  NetWireword  Mid;
  NetWirebyte  WordCount;         // 0
  NetWireMarker16 ByteCount;
  NetWireArray<NetSmb1Dialect> Dialects;

  /// Flags, Flags2 and dialects a client sends to be answered in SMB2.
  void set_multi_protocol_defaults();
  void add_dialect(const char *name) { Dialects.push_back(NetSmb1Dialect(name)); }
  bool offers_dialect(const char *name) const;
  bool is_smb2_supported() const { return offers_dialect(SMB1_DIALECT_SMB2_002); }

  const char *command_name() { return "SMB1_NEGOTIATE"; }
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

/// True when the bytes start with the SMB1 protocol id.
bool smb2wire_is_smb1_message(const byte *bytes, dword length);

#endif // include_smb1negotiate
