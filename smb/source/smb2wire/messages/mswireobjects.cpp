//
// mswireobjects.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//
//

#include "mswireobjects.hpp"

void ms_FILE_ID_BOTH_DIR_INFORMATION::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(FileIndex);
  BINDFIELD(CreationTime);
  BINDFIELD(LastAccessTime);
  BINDFIELD(LastWriteTime);
  BINDFIELD(ChangeTime);
  BINDFIELD(EndofFile);
  BINDFIELD(AllocationSize);
  BINDFIELD(FileAttributes);
  BINDMARKER(FileNameLength);
  BINDFIELD(EaSize);
  BINDFIELD(ShortNameLength);
  BINDRESERVED(Reserved1);
  BINDFIELD(ShortName);
  BINDRESERVED(Reserved2);
  BINDFIELD(FileId);
  BINDPAYLOAD(FileName).sized_by(FileNameLength);
}

void ms_FILE_ID_BOTH_DIR_INFORMATION::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"FILE_ID_BOTH_DIR_INFORMATION: %s size: %llu attributes: %X\n",
                 FileName.ascii().c_str(), (unsigned long long) EndofFile(), FileAttributes());
}

void ms_FILE_NOTIFY_INFORMATION::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(Action);
  BINDMARKER(FileNameLength);
  BINDPAYLOAD(FileName).sized_by(FileNameLength);
}

void ms_FILE_FULL_EA_INFORMATION::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(Flags);
  BINDMARKER(EaNameLength);
  BINDMARKER(EaValueLength);
  BINDPAYLOAD(EaName).sized_by(EaNameLength);
  BINDCONSTANT(EaNameTerminator, 0);
  BINDPAYLOAD(EaValue).sized_by(EaValueLength);
}

void ms_FILE_RENAME_INFORMATION::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(ReplaceIfExists);
  BINDRESERVED(Reserved);
  BINDFIELD(RootDirectory);
  BINDMARKER(FileNameLength);
  BINDPAYLOAD(FileName).sized_by(FileNameLength);
}

std::string smb2_info_key(byte info_type, byte info_class)
{
  return netwire_key(info_type) + netwire_key(info_class);
}

static NetWireVariantRegistry build_set_info_registry()
{
  NetWireVariantRegistry r("SMB2_SET_INFO buffer");
  r.add(smb2_info_key(SMB2_0_INFO_FILE, SMB2_FILE_RENAME_INFO),      netwire_make_variant<ms_FILE_RENAME_INFORMATION>)
   .add(smb2_info_key(SMB2_0_INFO_FILE, SMB2_FILE_DISPOSITION_INFO), netwire_make_variant<ms_FILE_DISPOSITION_INFORMATION>)
   .add(smb2_info_key(SMB2_0_INFO_FILE, SMB2_FILE_END_OF_FILE_INFO),   netwire_make_variant<ms_FILE_END_OF_FILE_INFORMATION>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

const NetWireVariantRegistry &smb2_set_info_registry()
{
  static const NetWireVariantRegistry registry = build_set_info_registry();
  return registry;
}
