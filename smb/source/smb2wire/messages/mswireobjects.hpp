//
// mswireobjects.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  MS-FSCC records carried inside SMB2 buffers. Directory listings, change
//  notifications, extended attributes and the SET_INFO information classes.
//
#ifndef include_mswireobjects
#define include_mswireobjects

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"
#include "wiresizedstring.hpp"
#include "wiretagged.hpp"

/* SMB2_SET_INFO InfoType */
#define SMB2_0_INFO_FILE                  0x01
#define SMB2_0_INFO_FILESYSTEM            0x02
#define SMB2_0_INFO_SECURITY              0x03
#define SMB2_0_INFO_QUOTA                 0x04

/* FileInformationClass values used with SMB2_0_INFO_FILE */
#define SMB2_FILE_BASIC_INFO              0x04
#define SMB2_FILE_RENAME_INFO             0x0A
#define SMB2_FILE_DISPOSITION_INFO        0x0D
#define SMB2_FILE_END_OF_FILE_INFO        0x14

/* FILE_NOTIFY_INFORMATION Action */
#define FILE_ACTION_ADDED                 0x00000001
#define FILE_ACTION_REMOVED               0x00000002
#define FILE_ACTION_MODIFIED              0x00000003
#define FILE_ACTION_RENAMED_OLD_NAME      0x00000004
#define FILE_ACTION_RENAMED_NEW_NAME      0x00000005

/* FILE_FULL_EA_INFORMATION Flags */
#define FILE_NEED_EA                      0x80

// Entry of a SMB2_QUERY_FileIdBothDirectoryInformation listing. NextEntryOffset is owned by the chained list.
class ms_FILE_ID_BOTH_DIR_INFORMATION  : public NetWireStruct   {
public:
  ms_FILE_ID_BOTH_DIR_INFORMATION() {objectsize=104; }
  NetWiredword FileIndex;
  NetWireFileTime CreationTime;
  NetWireFileTime LastAccessTime;
  NetWireFileTime LastWriteTime;
  NetWireFileTime ChangeTime;
  NetWireddword EndofFile;
  NetWireddword AllocationSize;
  NetWiredword FileAttributes;
  NetWireMarker32 FileNameLength;
  NetWiredword EaSize;
  NetWirebyte  ShortNameLength;
  NetWirebyte  Reserved1;
  NetWireblob24  ShortName;
  NetWireword  Reserved2;
  NetWireddword FileId;
  NetWireSizedString FileName;
  const char *command_name() { return "FILE_ID_BOTH_DIR_INFORMATION";}
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

typedef NetWireChainedList<ms_FILE_ID_BOTH_DIR_INFORMATION, 8> ms_FILE_ID_BOTH_DIR_LIST;

class ms_FILE_NOTIFY_INFORMATION  : public NetWireStruct   {
public:
  ms_FILE_NOTIFY_INFORMATION() {objectsize=8; }
  ms_FILE_NOTIFY_INFORMATION(dword action, const char *name) {objectsize=8; Action = action; FileName = name; }
  NetWiredword Action;
  NetWireMarker32 FileNameLength;
  NetWireSizedString FileName;
  const char *command_name() { return "FILE_NOTIFY_INFORMATION";}
protected:
  void BindFields(NetWireFieldTable &T);
};

typedef NetWireChainedList<ms_FILE_NOTIFY_INFORMATION, 4> ms_FILE_NOTIFY_LIST;

// EaNameLength does not count the NUL that follows EaName
class ms_FILE_FULL_EA_INFORMATION  : public NetWireStruct   {
public:
  ms_FILE_FULL_EA_INFORMATION() {objectsize=8; }
  NetWirebyte  Flags;
  NetWireMarker8  EaNameLength;
  NetWireMarker16 EaValueLength;
  NetWireblob  EaName;
  NetWirebyte  EaNameTerminator;
  NetWireblob  EaValue;
  const char *command_name() { return "FILE_FULL_EA_INFORMATION";}
  void set_name(const char *name) { EaName.assign((const byte *)name, (dword) strlen(name)); }
  std::string name() const { return std::string(EaName().begin(), EaName().end()); }
protected:
  void BindFields(NetWireFieldTable &T);
};

typedef NetWireChainedList<ms_FILE_FULL_EA_INFORMATION, 4> ms_FILE_FULL_EA_LIST;

// SET_INFO buffers are keyed by the (InfoType, InfoClass) byte pair
std::string smb2_info_key(byte info_type, byte info_class);

class NetSmb2SetInfoVariant : public NetWireVariant {
public:
  virtual byte info_type() const { return SMB2_0_INFO_FILE; }
  virtual byte info_class() const = 0;
  std::string discriminant_key() const { return smb2_info_key(info_type(), info_class()); }
};

class ms_FILE_RENAME_INFORMATION  : public NetSmb2SetInfoVariant   {
public:
  ms_FILE_RENAME_INFORMATION() {objectsize=20; }
  NETWIRE_VARIANT(ms_FILE_RENAME_INFORMATION, "FileRenameInformation")
  byte info_class() const { return SMB2_FILE_RENAME_INFO; }
  NetWirebyte  ReplaceIfExists;
  NetWireFixedBlob<7> Reserved;
  NetWireddword RootDirectory;
  NetWireMarker32 FileNameLength;
  NetWireSizedString FileName;
protected:
  void BindFields(NetWireFieldTable &T);
};

class ms_FILE_DISPOSITION_INFORMATION  : public NetSmb2SetInfoVariant   {
public:
  ms_FILE_DISPOSITION_INFORMATION() {objectsize=1; }
  NETWIRE_VARIANT(ms_FILE_DISPOSITION_INFORMATION, "FileDispositionInformation")
  byte info_class() const { return SMB2_FILE_DISPOSITION_INFO; }
  NetWirebyte  DeletePending;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(DeletePending); }
};

class ms_FILE_END_OF_FILE_INFORMATION  : public NetSmb2SetInfoVariant   {
public:
  ms_FILE_END_OF_FILE_INFORMATION() {objectsize=8; }
  NETWIRE_VARIANT(ms_FILE_END_OF_FILE_INFORMATION, "FileEndOfFileInformation")
  byte info_class() const { return SMB2_FILE_END_OF_FILE_INFO; }
  NetWireddword EndOfFile;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(EndOfFile); }
};

/// Registered SET_INFO buffers. Other classes are kept as opaque bytes.
const NetWireVariantRegistry &smb2_set_info_registry();

#endif // include_mswireobjects
