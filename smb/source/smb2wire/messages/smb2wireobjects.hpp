//
// smb2wireobjects.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB2 header and command bodies. Every body lists its fields in
//  BindFields(), in wire order, in smb2wireobjects.cpp.
//
#ifndef include_smb2wireobjects
#define include_smb2wireobjects

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"
#include "wiresizedstring.hpp"
#include "wiretagged.hpp"
#include "smb2negotiatecontext.hpp"
#include "smb2createcontext.hpp"
#include "smb2fsctl.hpp"
#include "mswireobjects.hpp"

#define SMB2_NEGOTIATE_SIGNING_ENABLED  0x0001   // When set, indicates that security signatures are enabled on the server.
#define SMB2_NEGOTIATE_SIGNING_REQUIRED 0x0002   // When set, indicates that security signatures are required by the server.
#define SMB2_SESSION_FLAG_BINDING         0x01   //  When set, indicates that the request is to bind an existing session to a new connection.

#define SMB2_DIALECT_2002  0x0202
#define SMB2_DIALECT_2100  0x0210
#define SMB2_DIALECT_3000  0x0300
#define SMB2_DIALECT_3002  0x0302
#define SMB2_DIALECT_3110  0x0311
#define SMB2_DIALECT_WILD  0x02FF

#define SMB2_PROTOCOL_ID   0x424D53FE            // "\xfeSMB" read as a little endian dword

/* SMB2 Header structure command values and flag vlues. See  2.2.1.2, page 30 */
#define SMB2_NEGOTIATE          0x0000
#define SMB2_SESSION_SETUP      0x0001
#define SMB2_LOGOFF             0x0002
#define SMB2_TREE_CONNECT       0x0003
#define SMB2_TREE_DISCONNECT    0x0004
#define SMB2_CREATE             0x0005
#define SMB2_CLOSE              0x0006
#define SMB2_FLUSH              0x0007
#define SMB2_READ               0x0008
#define SMB2_WRITE              0x0009
#define SMB2_LOCK               0x000A
#define SMB2_IOCTL              0x000B
#define SMB2_CANCEL             0x000C
#define SMB2_ECHO               0x000D
#define SMB2_QUERY_DIRECTORY    0x000E
#define SMB2_CHANGE_NOTIFY      0x000F
#define SMB2_QUERY_INFO         0x0010
#define SMB2_SET_INFO           0x0011
#define SMB2_OPLOCK_BREAK       0x0012
#define SMB2_SERVER_TO_CLIENT_NOTIFICATION 0x0013

#define SMB2_FLAGS_SERVER_TO_REDIR              0x00000001
#define SMB2_FLAGS_ASYNC_COMMAND                0x00000002
#define SMB2_FLAGS_RELATED_OPERATIONS           0x00000004
#define SMB2_FLAGS_SIGNED                       0x00000008
#define SMB2_FLAGS_DFS_OPERATIONS               0x10000000
#define SMB2_FLAGS_REPLAY_OPERATION             0x20000000

#define SMB2_NT_STATUS_SUCCESS                  0x00000000
#define SMB2_STATUS_PENDING                     0x00000103
#define SMB2_STATUS_NOTIFY_ENUM_DIR             0x0000010C
#define SMB2_STATUS_BUFFER_OVERFLOW             0x80000005
#define SMB2_STATUS_INFO_LENGTH_MISMATCH        0xC0000004
#define SMB2_STATUS_NO_MORE_FILES               0x80000006 /* No more files were found that match the file specification. */
#define SMB2_STATUS_INVALID_PARAMETER           0xC000000D /* The parameter specified in the request is not valid. */
#define SMB2_STATUS_END_OF_FILE                 0xC0000011
#define SMB_NT_STATUS_MORE_PROCESSING_REQUIRED  0xC0000016
#define SMB2_STATUS_ACCESS_DENIED               0xC0000022
#define SMB2_STATUS_OBJECT_NAME_NOT_FOUND       0xC0000034
#define SMB2_STATUS_NOT_SUPPORTED               0xC00000BB /* The client request is not supported. */
#define SMB2_STATUS_BAD_NETWORK_NAME            0xC00000CC

/* RTSMB2_QUERY_DIRECTORY_C.FileInformationClass */
#define SMB2_QUERY_FileDirectoryInformation       0x01  /*  Basic information about a file or directory. Basic information is defined as the file's name, time stamp, size and attributes. File attributes are as specified in [MS-FSCC] section 2.6. */
#define SMB2_QUERY_FileFullDirectoryInformation   0x02  /*  Full information about a file or directory. Full information is defined as all the basic information plus extended attribute size. */
#define SMB2_QUERY_FileIdFullDirectoryInformation 0x26  /*  Full information plus volume file ID about a file or directory. A volume file ID is defined as a number assigned by the underlying object store that uniquely identifies a file within a volume. */
#define SMB2_QUERY_FileBothDirectoryInformation   0x03  /*  Basic information plus extended attribute size and short name about a file or directory. */
#define SMB2_QUERY_FileIdBothDirectoryInformation 0x25  /*  FileBothDirectoryInformation plus volume file ID about a file or directory. */
#define SMB2_QUERY_FileNamesInformation           0x0C  /*  Detailed information on the names of files and directories in a directory. */
/* RTSMB2_QUERY_DIRECTORY_C.Flags */
#define SMB2_QUERY_RESTART_SCANS          0x01     /*  The server MUST restart the enumeration from the beginning, but the search pattern is not changed. */
#define SMB2_QUERY_RETURN_SINGLE_ENTRY    0x02     /*  The server MUST only return the first entry of the search results. */
#define SMB2_QUERY_INDEX_SPECIFIED        0x04     /*  The server SHOULD<64> return entries beginning at the byte number specified by FileIndex. */
#define SMB2_QUERY_REOPEN                 0x10     /*  The server MUST restart the enumeration from the beginning, and the search pattern MUST be changed to the provided value. This often involves silently closing and reopening the directory on the server side. */

#define SMB2_OPLOCK_LEVEL_NONE 0x00
#define SMB2_OPLOCK_LEVEL_II 0x01
#define SMB2_OPLOCK_LEVEL_EXCLUSIVE 0x08
#define SMB2_OPLOCK_LEVEL_BATCH 0x09
#define SMB2_OPLOCK_LEVEL_LEASE 0xFF

#define SMB2_ImpersonationLevel_Anonymous           0x00000000
#define SMB2_ImpersonationLevel_Identification      0x00000001
#define SMB2_ImpersonationLevel_Impersonation       0x00000002
#define SMB2_ImpersonationLevel_Delegate            0x00000003

/* RTSMB2_CREATE_C::ShareAccess */
#define SMB2_FILE_SHARE_READ                        0x00000001
#define SMB2_FILE_SHARE_WRITE                       0x00000002
#define SMB2_FILE_SHARE_DELETE                      0x00000004

/* RTSMB2_CREATE_C::CreateDisposition */
#define SMB2_FILE_SUPERSEDE                         0x00000000
#define SMB2_FILE_OPEN                              0x00000001
#define SMB2_FILE_CREATE                            0x00000002
#define SMB2_FILE_OPEN_IF                           0x00000003
#define SMB2_FILE_OVERWRITE                         0x00000004
#define SMB2_FILE_OVERWRITE_IF                      0x00000005

#define SMB2_FPP_ACCESS_MASK_FILE_READ_DATA         0x00000001
#define SMB2_FPP_ACCESS_MASK_FILE_WRITE_DATA        0x00000002
#define SMB2_FPP_ACCESS_MASK_FILE_APPEND_DATA       0x00000004
#define SMB2_FPP_ACCESS_MASK_FILE_READ_EA           0x00000008
#define SMB2_FPP_ACCESS_MASK_FILE_WRITE_EA          0x00000010
#define SMB2_FPP_ACCESS_MASK_FILE_EXECUTE           0x00000020
#define SMB2_FPP_ACCESS_MASK_FILE_DELETE_CHILD      0x00000040
#define SMB2_FPP_ACCESS_MASK_FILE_READ_ATTRIBUTES   0x00000080
#define SMB2_FPP_ACCESS_MASK_FILE_WRITE_ATTRIBUTES  0x00000100
#define SMB2_FPP_ACCESS_MASK_DELETE                 0x00010000
#define SMB2_FPP_ACCESS_MASK_READ_CONTROL           0x00020000
#define SMB2_FPP_ACCESS_MASK_WRITE_DAC              0x00040000
#define SMB2_FPP_ACCESS_MASK_WRITE_OWNER            0x00080000
#define SMB2_FPP_ACCESS_MASK_SYNCHRONIZE            0x00100000
#define SMB2_FPP_ACCESS_MASK_MAXIMUM_ALLOWED        0x02000000
#define SMB2_FPP_ACCESS_MASK_GENERIC_ALL            0x10000000
#define SMB2_FPP_ACCESS_MASK_GENERIC_EXECUTE        0x20000000
#define SMB2_FPP_ACCESS_MASK_GENERIC_WRITE          0x40000000
#define SMB2_FPP_ACCESS_MASK_GENERIC_READ           0x80000000

/* RTSMB2_CREATE_C::CreateOptions */
#define FILE_DIRECTORY_FILE 0x00000001
#define FILE_WRITE_THROUGH 0x00000002
#define FILE_SEQUENTIAL_ONLY 0x00000004
#define FILE_SYNCHRONOUS_IO_NONALERT 0x00000020
#define FILE_NON_DIRECTORY_FILE 0x00000040
#define FILE_DELETE_ON_CLOSE 0x00001000
#define FILE_DISALLOW_EXCLUSIVE 0x00020000

#define SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB 0x0001
#define SMB2_WRITEFLAG_WRITE_THROUGH 0x00000001
#define SMB2_WRITEFLAG_WRITE_UNBUFFERED 0x00000002

#define SMB2_LOCKFLAG_SHARED_LOCK      0x00000001
#define SMB2_LOCKFLAG_EXCLUSIVE_LOCK   0x00000002
#define SMB2_LOCKFLAG_UNLOCK           0x00000004
#define SMB2_LOCKFLAG_FAIL_IMMEDIATELY 0x00000010

#define SMB2_WATCH_TREE                     0x0001
#define FILE_NOTIFY_CHANGE_FILE_NAME        0x00000001
#define FILE_NOTIFY_CHANGE_DIR_NAME         0x00000002
#define FILE_NOTIFY_CHANGE_ATTRIBUTES       0x00000004
#define FILE_NOTIFY_CHANGE_SIZE             0x00000008
#define FILE_NOTIFY_CHANGE_LAST_WRITE       0x00000010

#define SMB2_SHARE_TYPE_DISK   0x01
#define SMB2_SHARE_TYPE_PIPE   0x02
#define SMB2_SHARE_TYPE_PRINT  0x03

class NetSmb2Header  : public NetWireStruct   {
public:
  NetSmb2Header() {objectsize=64; }
  NetWiredword ProtocolId;
  NetWireword StructureSize; // 64
  NetWireword CreditCharge; /* (2 bytes): In the SMB 2.002 dialect, this field MUST NOT be used and MUST be reserved. */
  NetWiredword Status_ChannelSequenceReserved; /*  (4 bytes): */
  NetWireword Command;
  NetWireword CreditRequest_CreditResponse;
  NetWiredword Flags;
  NetWiredword NextCommand;
  NetWireddword MessageId;
  NetWiredword Reserved;    // ProcessId, or low half of AsyncId
  NetWiredword TreeId;      // high half of AsyncId
  NetWireddword SessionId;
  NetWireblob16 Signature;

  void Initialize(word command, ddword mid, ddword _SessionId)
  {
    Command = command;
    CreditCharge = 0;
    Status_ChannelSequenceReserved = 0;
    CreditRequest_CreditResponse = 0;
    Flags = 0;
    NextCommand = 0;
    MessageId = mid;
    Reserved = 0;
    TreeId =  0;
    SessionId = _SessionId;
  }
  // Reply header echoes the request identifiers
  void InitializeReply(NetSmb2Header &Smb2Header, dword status)
  {
    Initialize(Smb2Header.Command(), Smb2Header.MessageId(), Smb2Header.SessionId());
    Status_ChannelSequenceReserved = status;
    CreditRequest_CreditResponse   = Smb2Header.CreditRequest_CreditResponse();
    Flags = SMB2_FLAGS_SERVER_TO_REDIR;
    Reserved = Smb2Header.Reserved();
    TreeId   = Smb2Header.TreeId();
  }
  bool is_response() const { return (Flags() & SMB2_FLAGS_SERVER_TO_REDIR) != 0; }
  bool is_async() const    { return (Flags() & SMB2_FLAGS_ASYNC_COMMAND) != 0; }
  ddword async_id() const  { return ((ddword) TreeId() << 32) | Reserved(); }
  void set_async_id(ddword id)
  {
    Flags = Flags() | SMB2_FLAGS_ASYNC_COMMAND;
    Reserved = (dword) (id & 0xffffffff);
    TreeId = (dword) (id >> 32);
  }
  const char *command_name() { return "SMB2";}
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

/// Body of an SMB2 request or response, keyed by the header Command
class NetSmb2Command : public NetWireVariant {
public:
  virtual word command_id() const = 0;
  std::string discriminant_key() const { return netwire_key(command_id()); }
};

#define NETSMB2_COMMAND(C, ID, NAME) \
  NETWIRE_VARIANT(C, NAME) \
  word command_id() const { return ID; }

class NetSmb2NegotiateCmd  : public NetSmb2Command   {
public:
  NetSmb2NegotiateCmd() : NegotiateContexts(8) {objectsize=36; }
  NETSMB2_COMMAND(NetSmb2NegotiateCmd, SMB2_NEGOTIATE, "SMB2_NEGOTIATE")
  NetWireword StructureSize; // 36
  NetWireMarker16 DialectCount;
  NetWireword SecurityMode;
  NetWireword Reserved;
  NetWiredword Capabilities;
  NetWireGuid ClientGuid;
  NetWireMarker32 NegotiateContextOffset;
  NetWireMarker16 NegotiateContextCount;
  NetWireword Reserved2;
  NetWireArray<NetWireword> Dialects;
  NetSmb2NegotiateContextList NegotiateContexts;
  void add_dialect(word dialect) { Dialects.push_back(NetWireword(dialect)); }
  bool offers_dialect(word dialect) const;
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2NegotiateReply  : public NetSmb2Command   {
public:
  NetSmb2NegotiateReply() : NegotiateContexts(8) {objectsize=65; }
  NETSMB2_COMMAND(NetSmb2NegotiateReply, SMB2_NEGOTIATE, "SMB2_NEGOTIATE")
  NetWireword StructureSize; // 65
  NetWireword SecurityMode;
  NetWireword DialectRevision;
  NetWireMarker16 NegotiateContextCount;
  NetWireGuid ServerGuid;
  NetWiredword Capabilities;
  NetWiredword MaxTransactSize;
  NetWiredword MaxReadSize;
  NetWiredword MaxWriteSize;
  NetWireFileTime SystemTime;
  NetWireFileTime ServerStartTime;
  NetWireMarker16 SecurityBufferOffset;
  NetWireMarker16 SecurityBufferLength;
  NetWireMarker32 NegotiateContextOffset;
  NetWireblob SecurityBuffer;
  NetSmb2NegotiateContextList NegotiateContexts;
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
  NetStatus ValidateDecoded();
};

class NetSmb2SetupCmd  : public NetSmb2Command   {
public:
  NetSmb2SetupCmd() {objectsize=25; }
  NETSMB2_COMMAND(NetSmb2SetupCmd, SMB2_SESSION_SETUP, "SMB2_SESSION_SETUP")
  NetWireword  StructureSize; // 25
  NetWirebyte  Flags;
  NetWirebyte  SecurityMode;
  NetWiredword Capabilities;
  NetWiredword Channel;
  NetWireMarker16 SecurityBufferOffset;
  NetWireMarker16 SecurityBufferLength;
  NetWireddword PreviousSessionId;
  NetWireblob  Buffer;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2SetupReply  : public NetSmb2Command   {
public:
  NetSmb2SetupReply() {objectsize=9; }
  NETSMB2_COMMAND(NetSmb2SetupReply, SMB2_SESSION_SETUP, "SMB2_SESSION_SETUP")
  NetWireword  StructureSize; // 9
  NetWireword  SessionFlags;
  NetWireMarker16 SecurityBufferOffset;
  NetWireMarker16 SecurityBufferLength;
  NetWireblob  Buffer;
protected:
  void BindFields(NetWireFieldTable &T);
};

// StructureSize 4 and two reserved bytes. Logoff, tree disconnect, flush reply, lock reply, echo and cancel.
class NetSmb2MinimumCommand  : public NetSmb2Command   {
public:
  NetSmb2MinimumCommand() {objectsize=4; }
  NetWireword  StructureSize; // 4
  NetWireword  Reserved;
protected:
  void BindFields(NetWireFieldTable &T) { BINDCONSTANT(StructureSize, 4); BINDRESERVED(Reserved); }
};

#define NETSMB2_MINIMUM_COMMAND(C, ID, NAME) \
  class C : public NetSmb2MinimumCommand { public: NETSMB2_COMMAND(C, ID, NAME) };

NETSMB2_MINIMUM_COMMAND(NetSmb2LogoffCmd, SMB2_LOGOFF, "SMB2_LOGOFF")
NETSMB2_MINIMUM_COMMAND(NetSmb2DisconnectCmd, SMB2_TREE_DISCONNECT, "SMB2_TREE_DISCONNECT")
NETSMB2_MINIMUM_COMMAND(NetSmb2FlushReply, SMB2_FLUSH, "SMB2_FLUSH")
NETSMB2_MINIMUM_COMMAND(NetSmb2LockReply, SMB2_LOCK, "SMB2_LOCK")
NETSMB2_MINIMUM_COMMAND(NetSmb2EchoCmd, SMB2_ECHO, "SMB2_ECHO")
NETSMB2_MINIMUM_COMMAND(NetSmb2CancelCmd, SMB2_CANCEL, "SMB2_CANCEL")
typedef NetSmb2LogoffCmd NetSmb2LogoffReply;
typedef NetSmb2DisconnectCmd NetSmb2DisconnectReply;
typedef NetSmb2EchoCmd NetSmb2EchoReply;

class NetSmb2TreeconnectCmd  : public NetSmb2Command   {
public:
  NetSmb2TreeconnectCmd() {objectsize=9; }
  NETSMB2_COMMAND(NetSmb2TreeconnectCmd, SMB2_TREE_CONNECT, "SMB2_TREE_CONNECT")
  NetWireword  StructureSize; // 9
  NetWireword  Flags;
  NetWireMarker16 PathOffset;
  NetWireMarker16 PathLength;
  NetWireSizedString Path;
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2TreeconnectReply  : public NetSmb2Command   {
public:
  NetSmb2TreeconnectReply() {objectsize=16; }
  NETSMB2_COMMAND(NetSmb2TreeconnectReply, SMB2_TREE_CONNECT, "SMB2_TREE_CONNECT")
  NetWireword  StructureSize; // 16
  NetWirebyte  ShareType;
  NetWirebyte  Reserved;
  NetWiredword ShareFlags;
  NetWiredword Capabilities;
  NetWiredword MaximalAccess;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2CreateCmd  : public NetSmb2Command   {
public:
  NetSmb2CreateCmd() {objectsize=57; }
  NETSMB2_COMMAND(NetSmb2CreateCmd, SMB2_CREATE, "SMB2_CREATE")
  NetWireword  StructureSize; // 57
  NetWirebyte  SecurityFlags;
  NetWirebyte  RequestedOplockLevel;
  NetWiredword ImpersonationLevel;
  NetWireddword SmbCreateFlags;
  NetWireddword Reserved;
  NetWiredword DesiredAccess;
  NetWiredword FileAttributes;
  NetWiredword ShareAccess;
  NetWiredword CreateDisposition;
  NetWiredword CreateOptions;
  NetWireMarker16 NameOffset;
  NetWireMarker16 NameLength;
  NetWireMarker32 CreateContextsOffset;
  NetWireMarker32 CreateContextsLength;
  NetWireSizedString Name;
  NetSmb2CreateRequestContextList CreateContexts;
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2CreateReply  : public NetSmb2Command   {
public:
  NetSmb2CreateReply() {objectsize=89; }
  NETSMB2_COMMAND(NetSmb2CreateReply, SMB2_CREATE, "SMB2_CREATE")
  NetWireword  StructureSize; // 89
  NetWirebyte  OplockLevel;
  NetWirebyte  Flags;
  NetWiredword CreateAction;
  NetWireFileTime CreationTime;
  NetWireFileTime LastAccessTime;
  NetWireFileTime LastWriteTime;
  NetWireFileTime ChangeTime;
  NetWireddword AllocationSize;
  NetWireddword EndofFile;
  NetWiredword FileAttributes;
  NetWiredword Reserved2;
  NetWireFileId FileId;
  NetWireMarker32 CreateContextsOffset;
  NetWireMarker32 CreateContextsLength;
  NetSmb2CreateResponseContextList CreateContexts;
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2CloseCmd  : public NetSmb2Command   {
public:
  NetSmb2CloseCmd() {objectsize=24; }
  NETSMB2_COMMAND(NetSmb2CloseCmd, SMB2_CLOSE, "SMB2_CLOSE")
  NetWireword  StructureSize; // 24
  NetWireword  Flags;
  NetWiredword Reserved;
  NetWireFileId FileId;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2CloseReply  : public NetSmb2Command   {
public:
  NetSmb2CloseReply() {objectsize=60; }
  NETSMB2_COMMAND(NetSmb2CloseReply, SMB2_CLOSE, "SMB2_CLOSE")
  NetWireword  StructureSize; // 60
  NetWireword  Flags;
  NetWiredword Reserved;
  NetWireFileTime CreationTime;
  NetWireFileTime LastAccessTime;
  NetWireFileTime LastWriteTime;
  NetWireFileTime ChangeTime;
  NetWireddword AllocationSize;
  NetWireddword EndofFile;
  NetWiredword FileAttributes;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2FlushCmd  : public NetSmb2Command   {
public:
  NetSmb2FlushCmd() {objectsize=24; }
  NETSMB2_COMMAND(NetSmb2FlushCmd, SMB2_FLUSH, "SMB2_FLUSH")
  NetWireword  StructureSize; // 24
  NetWireword  Reserved1;
  NetWiredword Reserved2;
  NetWireFileId FileId;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2ReadCmd  : public NetSmb2Command   {
public:
  NetSmb2ReadCmd() {objectsize=49; }
  NETSMB2_COMMAND(NetSmb2ReadCmd, SMB2_READ, "SMB2_READ")
  NetWireword  StructureSize; // 49
  NetWirebyte  Padding;
  NetWirebyte  Flags;
  NetWiredword Length;
  NetWireddword Offset;
  NetWireFileId FileId;
  NetWiredword MinimumCount;
  NetWiredword Channel;
  NetWiredword RemainingBytes;
  NetWireword  ReadChannelInfoOffset;
  NetWireword  ReadChannelInfoLength;
  NetWirebyte  Buffer;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2ReadReply  : public NetSmb2Command   {
public:
  NetSmb2ReadReply() {objectsize=17; }
  NETSMB2_COMMAND(NetSmb2ReadReply, SMB2_READ, "SMB2_READ")
  NetWireword  StructureSize; // 17
  NetWireMarker8 DataOffset;
  NetWirebyte  Reserved;
  NetWireMarker32 DataLength;
  NetWiredword DataRemaining;
  NetWiredword Reserved2;
  NetWireblob  Data;
protected:
  void BindFields(NetWireFieldTable &T);
  NetStatus PrepareEncode();
  NetStatus ValidateDecoded();
};

// Length is normally Data.size(). A Length with no data behind it is accepted on decode,
// the data then follows the message. Fewer data bytes than Length is a NetStatusBoundsViolation.
class NetSmb2WriteCmd  : public NetSmb2Command   {
public:
  NetSmb2WriteCmd() {objectsize=49; }
  NETSMB2_COMMAND(NetSmb2WriteCmd, SMB2_WRITE, "SMB2_WRITE")
  NetWireword  StructureSize; // 49
  NetWireMarker16 DataOffset;
  NetWiredword Length;
  NetWireddword Offset;
  NetWireFileId FileId;
  NetWiredword Channel;
  NetWiredword RemainingBytes;
  NetWireword  WriteChannelInfoOffset;
  NetWireword  WriteChannelInfoLength;
  NetWiredword Flags;
  NetWireblob  Data;
protected:
  void BindFields(NetWireFieldTable &T);
  NetStatus PrepareEncode();
  NetStatus ValidateDecoded();
};

class NetSmb2WriteReply  : public NetSmb2Command   {
public:
  NetSmb2WriteReply() {objectsize=17; }
  NETSMB2_COMMAND(NetSmb2WriteReply, SMB2_WRITE, "SMB2_WRITE")
  NetWireword  StructureSize; // 17
  NetWireword  Reserved;
  NetWiredword Count;
  NetWiredword Remaining;
  NetWireword  WriteChannelInfoOffset;
  NetWireword  WriteChannelInfoLength;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2LockElement  : public NetWireStruct   {
public:
  NetSmb2LockElement() {objectsize=24; }
  NetSmb2LockElement(ddword offset, ddword length, dword flags) {objectsize=24; Offset = offset; Length = length; Flags = flags; }
  NetWireddword Offset;
  NetWireddword Length;
  NetWiredword Flags;
  NetWiredword Reserved;
  const char *command_name() { return "SMB2_LOCK_ELEMENT";}
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2LockCmd  : public NetSmb2Command   {
public:
  NetSmb2LockCmd() {objectsize=48; }
  NETSMB2_COMMAND(NetSmb2LockCmd, SMB2_LOCK, "SMB2_LOCK")
  NetWireword  StructureSize; // 48
  NetWireMarker16 LockCount;
  NetWiredword LockSequence;
  NetWireFileId FileId;
  NetWireArray<NetSmb2LockElement> Locks;
protected:
  void BindFields(NetWireFieldTable &T);
};

// Input is typed by CtlCode only for file system controls, other ioctls stay opaque
class NetSmb2IoctlCmd  : public NetSmb2Command   {
public:
  NetSmb2IoctlCmd() : Input(smb2_ioctl_input_registry()) {objectsize=57; }
  NETSMB2_COMMAND(NetSmb2IoctlCmd, SMB2_IOCTL, "SMB2_IOCTL")
  NetWireword  StructureSize; // 57
  NetWireword  Reserved;
  NetWiredword CtlCode;
  NetWireFileId FileId;
  NetWireMarker32 InputOffset;
  NetWireMarker32 InputCount;
  NetWiredword MaxInputResponse;
  NetWiredword OutputOffset;
  NetWiredword OutputCount;
  NetWiredword MaxOutputResponse;
  NetWiredword Flags;
  NetWiredword Reserved2;
  NetWireTaggedRecord Input;
  template <class V> V *input_as() const { return Input.variant_as<V>(); }
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2IoctlReply  : public NetSmb2Command   {
public:
  NetSmb2IoctlReply() {objectsize=49; }
  NETSMB2_COMMAND(NetSmb2IoctlReply, SMB2_IOCTL, "SMB2_IOCTL")
  NetWireword  StructureSize; // 49
  NetWireword  Reserved;
  NetWiredword CtlCode;
  NetWireFileId FileId;
  NetWireMarker32 InputOffset;
  NetWireMarker32 InputCount;
  NetWireMarker32 OutputOffset;
  NetWireMarker32 OutputCount;
  NetWiredword Flags;
  NetWiredword Reserved2;
  NetWireblob  InBuffer;
  NetWireblob  OutBuffer;
protected:
  void BindFields(NetWireFieldTable &T);
  NetStatus ValidateDecoded();
};

class NetSmb2NotifyCmd  : public NetSmb2Command   {
public:
  NetSmb2NotifyCmd() {objectsize=32; }
  NETSMB2_COMMAND(NetSmb2NotifyCmd, SMB2_CHANGE_NOTIFY, "SMB2_CHANGE_NOTIFY")
  NetWireword  StructureSize; // 32
  NetWireword  Flags;
  NetWiredword OutputBufferLength;
  NetWireFileId FileId;
  NetWiredword CompletionFilter;
  NetWiredword Reserved;
protected:
  void BindFields(NetWireFieldTable &T);
};

// Servers leave slack after the last notification, so termination is not strict
class NetSmb2NotifyReply  : public NetSmb2Command   {
public:
  NetSmb2NotifyReply() {objectsize=9; Notifications.set_strict_termination(false); }
  NETSMB2_COMMAND(NetSmb2NotifyReply, SMB2_CHANGE_NOTIFY, "SMB2_CHANGE_NOTIFY")
  NetWireword  StructureSize; // 9
  NetWireMarker16 OutputBufferOffset;
  NetWireMarker32 OutputBufferLength;
  ms_FILE_NOTIFY_LIST Notifications;
protected:
  void BindFields(NetWireFieldTable &T);
};

/* SMB2_SERVER_TO_CLIENT_NOTIFICATION NotificationType */
#define SMB2_NOTIFY_SESSION_CLOSED 0x00000000

/// NotificationType -> notification body, unknown types are rejected
const NetWireVariantRegistry &smb2_notification_registry();

class NetSmb2NotificationBody : public NetWireVariant {
public:
  virtual dword notification_type() const = 0;
  std::string discriminant_key() const { return netwire_key(notification_type()); }
};

class NetSmb2NotifySessionClosed : public NetSmb2NotificationBody {
public:
  NetSmb2NotifySessionClosed() {objectsize=4; }
  NETWIRE_VARIANT(NetSmb2NotifySessionClosed, "SMB2_NOTIFY_SESSION_CLOSED")
  dword notification_type() const { return SMB2_NOTIFY_SESSION_CLOSED; }
  NetWiredword Reserved;
protected:
  void BindFields(NetWireFieldTable &T) { BINDRESERVED(Reserved); }
};

// Unsolicited, sent by the server with MessageId 0xFFFFFFFFFFFFFFFF
class NetSmb2ServerToClientNotification  : public NetSmb2Command   {
public:
  NetSmb2ServerToClientNotification() : Notification(smb2_notification_registry()) {objectsize=12; }
  NETSMB2_COMMAND(NetSmb2ServerToClientNotification, SMB2_SERVER_TO_CLIENT_NOTIFICATION, "SMB2_SERVER_TO_CLIENT_NOTIFICATION")
  NetWireword  StructureSize; // 12
  NetWireword  Reserved;
  NetWiredword NotificationType;
  NetWireTaggedRecord Notification;
  template <class V> V *notification_as() const { return Notification.variant_as<V>(); }
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2SetinfoCmd  : public NetSmb2Command   {
public:
  NetSmb2SetinfoCmd() : Buffer(smb2_set_info_registry()) {objectsize=33; }
  NETSMB2_COMMAND(NetSmb2SetinfoCmd, SMB2_SET_INFO, "SMB2_SET_INFO")
  NetWireword  StructureSize; // 33
  NetWirebyte  InfoType;
  NetWirebyte  FileInfoClass;
  NetWireMarker32 BufferLength;
  NetWireMarker16 BufferOffset;
  NetWireword  Reserved;
  NetWiredword AdditionalInformation;
  NetWireFileId FileId;
  NetWireTaggedRecord Buffer;
  template <class V> V *buffer_as() const { return Buffer.variant_as<V>(); }
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2SetinfoReply  : public NetSmb2Command   {
public:
  NetSmb2SetinfoReply() {objectsize=2; }
  NETSMB2_COMMAND(NetSmb2SetinfoReply, SMB2_SET_INFO, "SMB2_SET_INFO")
  NetWireword  StructureSize; // 2
protected:
  void BindFields(NetWireFieldTable &T) { BINDCONSTANT(StructureSize, 2); }
};

class NetSmb2QuerydirectoryCmd  : public NetSmb2Command   {
public:
  NetSmb2QuerydirectoryCmd() {objectsize=33; }
  NETSMB2_COMMAND(NetSmb2QuerydirectoryCmd, SMB2_QUERY_DIRECTORY, "SMB2_QUERY_DIRECTORY")
  NetWireword  StructureSize; // 33
  NetWirebyte  FileInformationClass;
  NetWirebyte  Flags;
  NetWiredword FileIndex;
  NetWireFileId FileId;
  NetWireMarker16 FileNameOffset;
  NetWireMarker16 FileNameLength;
  NetWiredword OutputBufferLength;
  NetWireSizedString FileName;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2QuerydirectoryReply  : public NetSmb2Command   {
public:
  NetSmb2QuerydirectoryReply() {objectsize=9; }
  NETSMB2_COMMAND(NetSmb2QuerydirectoryReply, SMB2_QUERY_DIRECTORY, "SMB2_QUERY_DIRECTORY")
  NetWireword  StructureSize; // 9
  NetWireMarker16 OutputBufferOffset;
  NetWireMarker32 OutputBufferLength;
  NetWireblob  Buffer;
  /// Interpret Buffer as a SMB2_QUERY_FileIdBothDirectoryInformation listing
  NetStatus decode_id_both_directory(ms_FILE_ID_BOTH_DIR_LIST &Entries) const;
  /// Replace Buffer with an encoded listing
  NetStatus encode_id_both_directory(ms_FILE_ID_BOTH_DIR_LIST &Entries);
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2ErrorContext  : public NetWireStruct   {
public:
  NetSmb2ErrorContext() {objectsize=8; }
  NetWireMarker32 ErrorDataLength;
  NetWiredword ErrorId;
  NetWireblob  ErrorContextData;
  const char *command_name() { return "SMB2_ERROR_CONTEXT";}
protected:
  void BindFields(NetWireFieldTable &T);
};

// Contexts when the sibling count is non zero, otherwise raw bytes
class NetSmb2ErrorData  : public NetWireRecord   {
public:
  NetSmb2ErrorData() : Contexts(8) {}
  NetWireArray<NetSmb2ErrorContext> Contexts;
  NetWireblob Raw;
  NetStatus encode(NetStreamOutputBuffer &StreamBuffer) { return Contexts.size() ? Contexts.encode(StreamBuffer) : Raw.encode(StreamBuffer); }
  NetStatus decode(NetStreamInputBuffer &StreamBuffer);
  bool wire_empty() const { return Contexts.wire_empty() && Raw.wire_empty(); }
  void wire_clear() { Contexts.wire_clear(); Raw.wire_clear(); }
};

/// Body of any failed response. The header Command still names the request.
class NetSmb2ErrorReply  : public NetWireVariant   {
public:
  NetSmb2ErrorReply() {objectsize=9; }
  NETWIRE_VARIANT(NetSmb2ErrorReply, "SMB2_ERROR")
  std::string discriminant_key() const { return std::string(); }
  NetWireword  StructureSize; // 9
  NetWireMarker8 ErrorContextCount;
  NetWirebyte  Reserved;
  NetWireMarker32 ByteCount;
  NetSmb2ErrorData ErrorData;
protected:
  void BindFields(NetWireFieldTable &T);
};

#endif // include_smb2wireobjects
