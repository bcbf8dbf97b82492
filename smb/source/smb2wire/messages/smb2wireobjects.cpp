//
// smb2wireobjects.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Field tables for the SMB2 header and command bodies.
//

#include "smb2wireobjects.hpp"

void NetSmb2Header::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(ProtocolId, SMB2_PROTOCOL_ID);
  BINDCONSTANT(StructureSize, 64);
  BINDFIELD(CreditCharge);
  BINDFIELD(Status_ChannelSequenceReserved);
  BINDFIELD(Command);
  BINDFIELD(CreditRequest_CreditResponse);
  BINDFIELD(Flags);
  BINDFIELD(NextCommand);
  BINDFIELD(MessageId);
  BINDFIELD(Reserved);
  BINDFIELD(TreeId);
  BINDFIELD(SessionId);
  BINDFIELD(Signature);
}

void NetSmb2Header::show_contents()
{
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header Command       : %d\n", Command() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header Status        : %X\n", Status_ChannelSequenceReserved() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header CreditResponse: %d\n", CreditRequest_CreditResponse() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header Flags         : %X\n", Flags() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header NextCommand   : %d\n", NextCommand() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header MessageId     : %llu\n", (unsigned long long) MessageId() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header TreeId        : %X\n", TreeId() );
   diag_printf_fn(DIAG_INFORMATIONAL,":::::: NetSmb2Header SessionId     : %llX\n", (unsigned long long) SessionId() );
}

// Contexts follow the dialects, 8 byte aligned, only when 3.1.1 is offered
void NetSmb2NegotiateCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 36);
  BINDCOUNT(DialectCount, Dialects);
  BINDFIELD(SecurityMode);
  BINDRESERVED(Reserved);
  BINDFIELD(Capabilities);
  BINDFIELD(ClientGuid);
  BINDMARKER(NegotiateContextOffset);
  BINDCOUNT(NegotiateContextCount, NegotiateContexts);
  BINDRESERVED(Reserved2);
  BINDPAYLOAD(Dialects);
  BINDPAYLOAD(NegotiateContexts).aligned(8).at_offset(NegotiateContextOffset).optional();
}

bool NetSmb2NegotiateCmd::offers_dialect(word dialect) const
{
  for (size_t i = 0; i < Dialects.size(); i++)
    if (Dialects[i]() == dialect)
      return true;
  return false;
}

void NetSmb2NegotiateCmd::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_NEGOTIATE request dialects: %d contexts: %d\n", (int) Dialects.size(), (int) NegotiateContexts.size());
  for (size_t i = 0; i < Dialects.size(); i++)
    diag_printf_fn(DIAG_INFORMATIONAL,"   dialect %X\n", Dialects[i]());
}

void NetSmb2NegotiateReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 65);
  BINDFIELD(SecurityMode);
  BINDFIELD(DialectRevision);
  BINDCOUNT(NegotiateContextCount, NegotiateContexts);
  BINDFIELD(ServerGuid);
  BINDFIELD(Capabilities);
  BINDFIELD(MaxTransactSize);
  BINDFIELD(MaxReadSize);
  BINDFIELD(MaxWriteSize);
  BINDFIELD(SystemTime);
  BINDFIELD(ServerStartTime);
  BINDMARKER(SecurityBufferOffset);
  BINDMARKER(SecurityBufferLength);
  BINDMARKER(NegotiateContextOffset);
  BINDPAYLOAD(SecurityBuffer).at_offset(SecurityBufferOffset).sized_by(SecurityBufferLength);
  BINDPAYLOAD(NegotiateContexts).aligned(8).at_offset(NegotiateContextOffset).optional();
}

// Negotiate contexts are carried exactly when 3.1.1 was selected
NetStatus NetSmb2NegotiateReply::ValidateDecoded()
{
  bool is_311 = DialectRevision() == SMB2_DIALECT_3110;
  if (is_311 != (NegotiateContexts.size() > 0))
  {
    diag_printf_fn(DIAG_DEBUG, "SMB2_NEGOTIATE reply: dialect %X with %d negotiate contexts\n", DialectRevision(), (int) NegotiateContexts.size());
    return NetStatusStructuralViolation;
  }
  return NetStatusOk;
}

void NetSmb2NegotiateReply::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_NEGOTIATE reply dialect: %X security buffer: %d contexts: %d\n",
                 DialectRevision(), (int) SecurityBuffer.size(), (int) NegotiateContexts.size());
}

void NetSmb2SetupCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 25);
  BINDFIELD(Flags);
  BINDFIELD(SecurityMode);
  BINDFIELD(Capabilities);
  BINDFIELD(Channel);
  BINDMARKER(SecurityBufferOffset);
  BINDMARKER(SecurityBufferLength);
  BINDFIELD(PreviousSessionId);
  BINDPAYLOAD(Buffer).at_offset(SecurityBufferOffset).sized_by(SecurityBufferLength);
}

void NetSmb2SetupReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 9);
  BINDFIELD(SessionFlags);
  BINDMARKER(SecurityBufferOffset);
  BINDMARKER(SecurityBufferLength);
  BINDPAYLOAD(Buffer).at_offset(SecurityBufferOffset).sized_by(SecurityBufferLength);
}

void NetSmb2TreeconnectCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 9);
  BINDFIELD(Flags);
  BINDMARKER(PathOffset);
  BINDMARKER(PathLength);
  BINDPAYLOAD(Path).at_offset(PathOffset).sized_by(PathLength);
}

void NetSmb2TreeconnectCmd::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_TREE_CONNECT request path: %s\n", Path.ascii().c_str());
  if (Path.utf16_length())
    diag_dump_unicode_fn(DIAG_DEBUG, "Path", &Path()[0], (int) Path.byte_length());
}

void NetSmb2TreeconnectReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 16);
  BINDFIELD(ShareType);
  BINDRESERVED(Reserved);
  BINDFIELD(ShareFlags);
  BINDFIELD(Capabilities);
  BINDFIELD(MaximalAccess);
}

void NetSmb2CreateCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 57);
  BINDRESERVED(SecurityFlags);
  BINDFIELD(RequestedOplockLevel);
  BINDFIELD(ImpersonationLevel);
  BINDRESERVED(SmbCreateFlags);
  BINDRESERVED(Reserved);
  BINDFIELD(DesiredAccess);
  BINDFIELD(FileAttributes);
  BINDFIELD(ShareAccess);
  BINDFIELD(CreateDisposition);
  BINDFIELD(CreateOptions);
  BINDMARKER(NameOffset);
  BINDMARKER(NameLength);
  BINDMARKER(CreateContextsOffset);
  BINDMARKER(CreateContextsLength);
  BINDPAYLOAD(Name).aligned(8).at_offset(NameOffset).sized_by(NameLength);
  BINDPAYLOAD(CreateContexts).aligned(8).at_offset(CreateContextsOffset).sized_by(CreateContextsLength);
}

void NetSmb2CreateCmd::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_CREATE request name: %s disposition: %d contexts: %d\n",
                 Name.ascii().c_str(), CreateDisposition(), (int) CreateContexts.size());
}

void NetSmb2CreateReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 89);
  BINDFIELD(OplockLevel);
  BINDFIELD(Flags);
  BINDFIELD(CreateAction);
  BINDFIELD(CreationTime);
  BINDFIELD(LastAccessTime);
  BINDFIELD(LastWriteTime);
  BINDFIELD(ChangeTime);
  BINDFIELD(AllocationSize);
  BINDFIELD(EndofFile);
  BINDFIELD(FileAttributes);
  BINDRESERVED(Reserved2);
  BINDFIELD(FileId);
  BINDMARKER(CreateContextsOffset);
  BINDMARKER(CreateContextsLength);
  BINDPAYLOAD(CreateContexts).aligned(8).at_offset(CreateContextsOffset).offset_must_align(8).sized_by(CreateContextsLength);
}

void NetSmb2CreateReply::show_contents()
{
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_CREATE reply action: %d attributes: %X contexts: %d\n",
                 CreateAction(), FileAttributes(), (int) CreateContexts.size());
}

void NetSmb2CloseCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 24);
  BINDFIELD(Flags);
  BINDRESERVED(Reserved);
  BINDFIELD(FileId);
}

void NetSmb2CloseReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 60);
  BINDFIELD(Flags);
  BINDRESERVED(Reserved);
  BINDFIELD(CreationTime);
  BINDFIELD(LastAccessTime);
  BINDFIELD(LastWriteTime);
  BINDFIELD(ChangeTime);
  BINDFIELD(AllocationSize);
  BINDFIELD(EndofFile);
  BINDFIELD(FileAttributes);
}

void NetSmb2FlushCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 24);
  BINDRESERVED(Reserved1);
  BINDRESERVED(Reserved2);
  BINDFIELD(FileId);
}

void NetSmb2ReadCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 49);
  BINDFIELD(Padding);
  BINDFIELD(Flags);
  BINDFIELD(Length);
  BINDFIELD(Offset);
  BINDFIELD(FileId);
  BINDFIELD(MinimumCount);
  BINDFIELD(Channel);
  BINDFIELD(RemainingBytes);
  BINDFIELD(ReadChannelInfoOffset);
  BINDFIELD(ReadChannelInfoLength);
  BINDRESERVED(Buffer);
}

void NetSmb2ReadReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 17);
  BINDMARKER(DataOffset);
  BINDRESERVED(Reserved);
  BINDMARKER(DataLength);
  BINDFIELD(DataRemaining);
  BINDRESERVED(Reserved2);
  BINDPAYLOAD(Data).at_offset(DataOffset).sized_by(DataLength);
}

// End of file is reported with a status, a successful read returns at least one byte
NetStatus NetSmb2ReadReply::PrepareEncode()
{
  if (Data.size() == 0)
  {
    diag_printf_fn(DIAG_DEBUG, "SMB2_READ reply: encode with no data\n");
    return NetStatusBadCallParms;
  }
  return NetStatusOk;
}

// Data can not start inside the header or the fixed part of the reply
NetStatus NetSmb2ReadReply::ValidateDecoded()
{
  if (DataOffset() < 64 + 16)
  {
    diag_printf_fn(DIAG_DEBUG, "SMB2_READ reply: DataOffset %d overlaps the fixed part\n", (int) DataOffset());
    return NetStatusStructuralViolation;
  }
  if (DataLength() == 0)
  {
    diag_printf_fn(DIAG_DEBUG, "SMB2_READ reply: DataLength is 0\n");
    return NetStatusStructuralViolation;
  }
  return NetStatusOk;
}

void NetSmb2WriteCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 49);
  BINDMARKER(DataOffset);
  BINDFIELD(Length);
  BINDFIELD(Offset);
  BINDFIELD(FileId);
  BINDFIELD(Channel);
  BINDFIELD(RemainingBytes);
  BINDFIELD(WriteChannelInfoOffset);
  BINDFIELD(WriteChannelInfoLength);
  BINDFIELD(Flags);
  BINDPAYLOAD(Data).at_offset(DataOffset);
}

NetStatus NetSmb2WriteCmd::PrepareEncode()
{
  if (Data.size())
    Length = Data.size();
  return NetStatusOk;
}

// Data runs to the end of the message, keep Length bytes of it
NetStatus NetSmb2WriteCmd::ValidateDecoded()
{
  if (Data.size() && Data.size() < Length())
  {
    diag_printf_fn(DIAG_DEBUG, "SMB2_WRITE request: Length %u with only %d data bytes\n", Length(), (int) Data.size());
    return NetStatusBoundsViolation;
  }
  if (Data.size() > Length())
  {
    std::vector<byte> kept(Data().begin(), Data().begin() + Length());
    Data = kept;
  }
  return NetStatusOk;
}

void NetSmb2WriteReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 17);
  BINDRESERVED(Reserved);
  BINDFIELD(Count);
  BINDFIELD(Remaining);
  BINDFIELD(WriteChannelInfoOffset);
  BINDFIELD(WriteChannelInfoLength);
}

void NetSmb2LockElement::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(Offset);
  BINDFIELD(Length);
  BINDFIELD(Flags);
  BINDRESERVED(Reserved);
}

void NetSmb2LockCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 48);
  BINDCOUNT(LockCount, Locks);
  BINDFIELD(LockSequence);
  BINDFIELD(FileId);
  BINDPAYLOAD(Locks);
}

void NetSmb2IoctlCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 57);
  BINDRESERVED(Reserved);
  BINDFIELD(CtlCode);
  BINDFIELD(FileId);
  BINDMARKER(InputOffset);
  BINDMARKER(InputCount);
  BINDFIELD(MaxInputResponse);
  BINDRESERVED(OutputOffset).must_be_zero();
  BINDRESERVED(OutputCount).must_be_zero();
  BINDFIELD(MaxOutputResponse);
  BINDFIELD(Flags);
  BINDRESERVED(Reserved2);
  BINDPAYLOAD(Input).at_offset(InputOffset).sized_by(InputCount).tagged_by(CtlCode, Flags);
}

void NetSmb2IoctlReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 49);
  BINDRESERVED(Reserved);
  BINDFIELD(CtlCode);
  BINDFIELD(FileId);
  BINDMARKER(InputOffset);
  BINDMARKER(InputCount);
  BINDMARKER(OutputOffset);
  BINDMARKER(OutputCount);
  BINDFIELD(Flags);
  BINDRESERVED(Reserved2);
  BINDPAYLOAD(InBuffer).at_offset(InputOffset).sized_by(InputCount);
  BINDPAYLOAD(OutBuffer).at_offset(OutputOffset).sized_by(OutputCount);
}

// The output buffer is either absent or directly follows the input buffer
NetStatus NetSmb2IoctlReply::ValidateDecoded()
{
  if (OutputOffset() != 0 && OutputOffset() != InputOffset() + InputCount())
  {
    diag_printf_fn(DIAG_DEBUG, "SMB2_IOCTL reply: OutputOffset %u, input ends at %u\n", OutputOffset(), InputOffset() + InputCount());
    return NetStatusStructuralViolation;
  }
  return NetStatusOk;
}

void NetSmb2NotifyCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 32);
  BINDFIELD(Flags);
  BINDFIELD(OutputBufferLength);
  BINDFIELD(FileId);
  BINDFIELD(CompletionFilter);
  BINDRESERVED(Reserved);
}

void NetSmb2NotifyReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 9);
  BINDMARKER(OutputBufferOffset);
  BINDMARKER(OutputBufferLength);
  BINDPAYLOAD(Notifications).at_offset(OutputBufferOffset).sized_by(OutputBufferLength).optional();
}

static NetWireVariantRegistry build_notification_registry()
{
  NetWireVariantRegistry r("SMB2_SERVER_TO_CLIENT_NOTIFICATION");
  r.add(netwire_key((dword)SMB2_NOTIFY_SESSION_CLOSED), netwire_make_variant<NetSmb2NotifySessionClosed>);
  return r;
}

const NetWireVariantRegistry &smb2_notification_registry()
{
  static const NetWireVariantRegistry registry = build_notification_registry();
  return registry;
}

void NetSmb2ServerToClientNotification::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 12);
  BINDRESERVED(Reserved);
  BINDFIELD(NotificationType);
  BINDPAYLOAD(Notification).tagged_by(NotificationType);
}

void NetSmb2SetinfoCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 33);
  BINDFIELD(InfoType);
  BINDFIELD(FileInfoClass);
  BINDMARKER(BufferLength);
  BINDMARKER(BufferOffset);
  BINDRESERVED(Reserved);
  BINDFIELD(AdditionalInformation);
  BINDFIELD(FileId);
  BINDPAYLOAD(Buffer).at_offset(BufferOffset).sized_by(BufferLength).tagged_by(InfoType, FileInfoClass);
}

void NetSmb2QuerydirectoryCmd::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 33);
  BINDFIELD(FileInformationClass);
  BINDFIELD(Flags);
  BINDFIELD(FileIndex);
  BINDFIELD(FileId);
  BINDMARKER(FileNameOffset);
  BINDMARKER(FileNameLength);
  BINDFIELD(OutputBufferLength);
  BINDPAYLOAD(FileName).at_offset(FileNameOffset).sized_by(FileNameLength);
}

void NetSmb2QuerydirectoryReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 9);
  BINDMARKER(OutputBufferOffset);
  BINDMARKER(OutputBufferLength);
  BINDPAYLOAD(Buffer).at_offset(OutputBufferOffset).sized_by(OutputBufferLength);
}

NetStatus NetSmb2QuerydirectoryReply::decode_id_both_directory(ms_FILE_ID_BOTH_DIR_LIST &Entries) const
{
  const std::vector<byte> &bytes = Buffer();
  NetStreamInputBuffer ListStream(bytes.empty() ? 0 : &bytes[0], (dword) bytes.size());
  return Entries.decode(ListStream);
}

NetStatus NetSmb2QuerydirectoryReply::encode_id_both_directory(ms_FILE_ID_BOTH_DIR_LIST &Entries)
{
  NetStreamOutputBuffer ListStream;
  PROPAGATE_NETSTATUS(Entries.encode(ListStream));
  Buffer = ListStream.contents();
  return NetStatusOk;
}

void NetSmb2ErrorContext::BindFields(NetWireFieldTable &T)
{
  BINDMARKER(ErrorDataLength);
  BINDFIELD(ErrorId);
  BINDPAYLOAD(ErrorContextData).sized_by(ErrorDataLength);
}

NetStatus NetSmb2ErrorData::decode(NetStreamInputBuffer &StreamBuffer)
{
  Raw.wire_clear();
  if (Contexts.expecting_elements())
    return Contexts.decode(StreamBuffer);
  Contexts.wire_clear();
  return Raw.decode(StreamBuffer);
}

void NetSmb2ErrorReply::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 9);
  BINDCOUNT(ErrorContextCount, ErrorData.Contexts);
  BINDRESERVED(Reserved);
  BINDMARKER(ByteCount);
  BINDPAYLOAD(ErrorData).sized_by(ByteCount);
}
