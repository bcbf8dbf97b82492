//
// smb2message.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Header and body dispatch for complete SMB2 messages.
//

#include "smb2message.hpp"

static NetWireVariantRegistry build_request_registry()
{
  NetWireVariantRegistry r("SMB2 request");
  r.add(netwire_key((word)SMB2_NEGOTIATE),        netwire_make_variant<NetSmb2NegotiateCmd>)
   .add(netwire_key((word)SMB2_SESSION_SETUP),    netwire_make_variant<NetSmb2SetupCmd>)
   .add(netwire_key((word)SMB2_LOGOFF),           netwire_make_variant<NetSmb2LogoffCmd>)
   .add(netwire_key((word)SMB2_TREE_CONNECT),     netwire_make_variant<NetSmb2TreeconnectCmd>)
   .add(netwire_key((word)SMB2_TREE_DISCONNECT),  netwire_make_variant<NetSmb2DisconnectCmd>)
   .add(netwire_key((word)SMB2_CREATE),           netwire_make_variant<NetSmb2CreateCmd>)
   .add(netwire_key((word)SMB2_CLOSE),            netwire_make_variant<NetSmb2CloseCmd>)
   .add(netwire_key((word)SMB2_FLUSH),            netwire_make_variant<NetSmb2FlushCmd>)
   .add(netwire_key((word)SMB2_READ),             netwire_make_variant<NetSmb2ReadCmd>)
   .add(netwire_key((word)SMB2_WRITE),            netwire_make_variant<NetSmb2WriteCmd>)
   .add(netwire_key((word)SMB2_LOCK),             netwire_make_variant<NetSmb2LockCmd>)
   .add(netwire_key((word)SMB2_IOCTL),            netwire_make_variant<NetSmb2IoctlCmd>)
   .add(netwire_key((word)SMB2_CANCEL),           netwire_make_variant<NetSmb2CancelCmd>)
   .add(netwire_key((word)SMB2_ECHO),             netwire_make_variant<NetSmb2EchoCmd>)
   .add(netwire_key((word)SMB2_QUERY_DIRECTORY),  netwire_make_variant<NetSmb2QuerydirectoryCmd>)
   .add(netwire_key((word)SMB2_CHANGE_NOTIFY),    netwire_make_variant<NetSmb2NotifyCmd>)
   .add(netwire_key((word)SMB2_SET_INFO),         netwire_make_variant<NetSmb2SetinfoCmd>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

static NetWireVariantRegistry build_response_registry()
{
  NetWireVariantRegistry r("SMB2 response");
  r.add(netwire_key((word)SMB2_NEGOTIATE),        netwire_make_variant<NetSmb2NegotiateReply>)
   .add(netwire_key((word)SMB2_SESSION_SETUP),    netwire_make_variant<NetSmb2SetupReply>)
   .add(netwire_key((word)SMB2_LOGOFF),           netwire_make_variant<NetSmb2LogoffReply>)
   .add(netwire_key((word)SMB2_TREE_CONNECT),     netwire_make_variant<NetSmb2TreeconnectReply>)
   .add(netwire_key((word)SMB2_TREE_DISCONNECT),  netwire_make_variant<NetSmb2DisconnectReply>)
   .add(netwire_key((word)SMB2_CREATE),           netwire_make_variant<NetSmb2CreateReply>)
   .add(netwire_key((word)SMB2_CLOSE),            netwire_make_variant<NetSmb2CloseReply>)
   .add(netwire_key((word)SMB2_FLUSH),            netwire_make_variant<NetSmb2FlushReply>)
   .add(netwire_key((word)SMB2_READ),             netwire_make_variant<NetSmb2ReadReply>)
   .add(netwire_key((word)SMB2_WRITE),            netwire_make_variant<NetSmb2WriteReply>)
   .add(netwire_key((word)SMB2_LOCK),             netwire_make_variant<NetSmb2LockReply>)
   .add(netwire_key((word)SMB2_IOCTL),            netwire_make_variant<NetSmb2IoctlReply>)
   .add(netwire_key((word)SMB2_ECHO),             netwire_make_variant<NetSmb2EchoReply>)
   .add(netwire_key((word)SMB2_QUERY_DIRECTORY),  netwire_make_variant<NetSmb2QuerydirectoryReply>)
   .add(netwire_key((word)SMB2_CHANGE_NOTIFY),    netwire_make_variant<NetSmb2NotifyReply>)
   .add(netwire_key((word)SMB2_SET_INFO),         netwire_make_variant<NetSmb2SetinfoReply>)
   .add(netwire_key((word)SMB2_SERVER_TO_CLIENT_NOTIFICATION), netwire_make_variant<NetSmb2ServerToClientNotification>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

static NetWireVariantRegistry build_error_registry()
{
  NetWireVariantRegistry r("SMB2 error response");
  r.set_fallback(netwire_make_variant<NetSmb2ErrorReply>);
  return r;
}

const NetWireVariantRegistry &smb2_request_registry()
{
  static const NetWireVariantRegistry registry = build_request_registry();
  return registry;
}

const NetWireVariantRegistry &smb2_response_registry()
{
  static const NetWireVariantRegistry registry = build_response_registry();
  return registry;
}

const NetWireVariantRegistry &smb2_error_registry()
{
  static const NetWireVariantRegistry registry = build_error_registry();
  return registry;
}

// Partial results: a read of a message mode pipe, an ioctl and a query info
// that did not fit MaxOutputResponse still carry the command's own body.
static bool partial_result_status(word command, dword status)
{
  if (status != SMB2_STATUS_BUFFER_OVERFLOW)
    return false;
  return command == SMB2_READ || command == SMB2_IOCTL || command == SMB2_QUERY_INFO;
}

bool NetSmb2PlainMessage::carries_error_body() const
{
  dword status = Header.Status_ChannelSequenceReserved();
  if (!Header.is_response() || status == SMB2_NT_STATUS_SUCCESS || status == SMB_NT_STATUS_MORE_PROCESSING_REQUIRED)
    return false;
  return !partial_result_status(Header.Command(), status);
}

const NetWireVariantRegistry &NetSmb2PlainMessage::body_registry() const
{
  if (!Header.is_response())
    return smb2_request_registry();
  if (carries_error_body())
    return smb2_error_registry();
  return smb2_response_registry();
}

NetStatus NetSmb2PlainMessage::encode(NetStreamOutputBuffer &StreamBuffer)
{
  NetWireVariant *body = Body();
  if (!body)
  {
    diag_printf_fn(DIAG_DEBUG, "NetSmb2PlainMessage: encode with no body\n");
    return NetStatusBadCallParms;
  }
  NetSmb2Command *command = dynamic_cast<NetSmb2Command *>(body);
  if (command)
    Header.Command = command->command_id();
  if ((dynamic_cast<NetSmb2ErrorReply *>(body) != 0) != carries_error_body())
  {
    diag_printf_fn(DIAG_DEBUG, "NetSmb2PlainMessage: %s body does not match status %X\n", body->variant_name(), Header.Status_ChannelSequenceReserved());
    return NetStatusBadCallParms;
  }
  PROPAGATE_NETSTATUS(Header.encode(StreamBuffer));
  return Body.encode(StreamBuffer);
}

NetStatus NetSmb2PlainMessage::decode(NetStreamInputBuffer &StreamBuffer)
{
  PROPAGATE_NETSTATUS(Header.decode(StreamBuffer));
  Body = NetWireTaggedRecord(body_registry());
  PROPAGATE_NETSTATUS(Body.select_variant(netwire_key(Header.Command())));
  return Body.decode(StreamBuffer);
}

NetStatus smb2wire_encode_message(NetSmb2PlainMessage &msg, std::vector<byte> &out)
{
  NetStreamOutputBuffer StreamBuffer;
  NetStatus r = msg.encode(StreamBuffer);
  if (r != NetStatusOk)
  {
    diag_printf_fn(DIAG_DEBUG, "smb2wire_encode_message: command %d failed: %s\n", msg.Header.Command(), smb2wire_status_string(r));
    return r;
  }
  out = StreamBuffer.contents();
  return NetStatusOk;
}

NetStatus smb2wire_encode_message(NetSmb2PlainMessage &msg, byte *buffer, dword buffer_size, dword &bytes_used)
{
  NetStreamOutputBuffer StreamBuffer;
  StreamBuffer.attach_buffer(buffer, buffer_size);
  bytes_used = 0;
  NetStatus r = msg.encode(StreamBuffer);
  if (r != NetStatusOk)
  {
    diag_printf_fn(DIAG_DEBUG, "smb2wire_encode_message: command %d failed: %s\n", msg.Header.Command(), smb2wire_status_string(r));
    return r;
  }
  bytes_used = StreamBuffer.buffered_count();
  return NetStatusOk;
}

NetStatus smb2wire_decode_message(const byte *bytes, dword length, NetSmb2PlainMessage &msg)
{
  NetStreamInputBuffer StreamBuffer(bytes, length);
  NetStatus r = msg.decode(StreamBuffer);
  if (r != NetStatusOk)
  {
    diag_printf_fn(DIAG_DEBUG, "smb2wire_decode_message: %d bytes failed at %u: %s\n", (int) length, StreamBuffer.stream_position(), smb2wire_status_string(r));
    diag_dump_bin_fn(DIAG_DEBUG, "smb2wire_decode_message", bytes, (int) length);
  }
  return r;
}
