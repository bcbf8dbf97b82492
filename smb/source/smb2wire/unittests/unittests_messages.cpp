//
// unittests_messages.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Session, file I/O, ioctl, change notify, set info, query directory and
//  error response bodies. Captured traffic is compared byte for byte.
//

#include "unittests.hpp"

static std::vector<byte> file_id_bytes(const NetWireFileId &FileId)
{
  return std::vector<byte>(FileId(), FileId() + 16);
}

// ===========================================================================
// Session setup, tree connect, echo, logoff
// ===========================================================================

static const char *setup_request_body =
  "190000010100000000000000580059000000000000000000"
  "605706062b0601050502a04d304ba00e300c060a2b06010401823702020aa23904374e544c"
  "4d535350000100000097b208e2090009002e00000006000600280000000a005d580000000f"
  "41564956564d574f524b47524f5550";

static const char *setup_reply_body =
  "090000004800b300"
  "a181b03081ada0030a0101a10c060a2b06010401823702020aa281970481944e544c4d5353"
  "5000020000000c000c003800000015c28ae2abf194bdb756daa9140001000000000050005000"
  "440000000a005d580000000f410056004900560056004d0002000c00410056004900560056"
  "004d0001000c00410056004900560056004d0004000c00410076006900760056006d000300"
  "0c00410076006900760056006d0007000800a876d878c569db0100000000";

static void test_session_setup(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing session setup *** " << endl;
  std::vector<byte> request = hex_to_bytes(setup_request_body);
  std::vector<byte> token(request.begin() + 24, request.end());
  TESTCHECK(token.size() == 89);

  NetSmb2SetupCmd *Cmd = new NetSmb2SetupCmd();
  Cmd->SecurityMode = SMB2_NEGOTIATE_SIGNING_ENABLED;
  Cmd->Capabilities = 1;
  Cmd->Buffer = token;
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(request, body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_SESSION_SETUP, false, 0, request, msg));
  NetSmb2SetupCmd *Decoded = msg.body_as<NetSmb2SetupCmd>();
  TESTCHECK(Decoded && Decoded->SecurityBufferOffset() == 0x58 && Decoded->SecurityBufferLength() == 89);
  if (Decoded)
    TESTBYTES(token, Decoded->Buffer());

  // A status of MORE_PROCESSING_REQUIRED still carries the setup reply
  std::vector<byte> reply = hex_to_bytes(setup_reply_body);
  TESTCHECK(reply.size() == 187);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_SESSION_SETUP, true, SMB_NT_STATUS_MORE_PROCESSING_REQUIRED, reply, msg));
  TESTCHECK(!msg.carries_error_body());
  NetSmb2SetupReply *DecodedReply = msg.body_as<NetSmb2SetupReply>();
  TESTCHECK(DecodedReply && DecodedReply->Buffer.size() == 179);

  NetSmb2SetupReply *Reply = new NetSmb2SetupReply();
  Reply->Buffer = std::vector<byte>(reply.begin() + 8, reply.end());
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, SMB_NT_STATUS_MORE_PROCESSING_REQUIRED, body));
  TESTBYTES(reply, body);

  // Security buffer longer than the message
  std::vector<byte> truncated(reply.begin(), reply.begin() + 100);
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_SESSION_SETUP, true, SMB_NT_STATUS_MORE_PROCESSING_REQUIRED, truncated, msg));
}

static void test_tree_connect(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing tree connect *** " << endl;
  const char *request_hex = "0900000048002a005c005c006100640063002e0061007600690076002e006c006f00630061006c005c004900500043002400";
  NetSmb2TreeconnectCmd *Cmd = new NetSmb2TreeconnectCmd();
  Cmd->Path = "\\\\adc.aviv.local\\IPC$";
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_TREE_CONNECT, false, 0, hex_to_bytes(request_hex), msg));
  NetSmb2TreeconnectCmd *Decoded = msg.body_as<NetSmb2TreeconnectCmd>();
  TESTCHECK(Decoded && Decoded->Path == "\\\\adc.aviv.local\\IPC$" && Decoded->Path.utf16_length() == 21);

  const char *reply_hex = "100001000008000000000000ff011f00";
  NetSmb2TreeconnectReply *Reply = new NetSmb2TreeconnectReply();
  Reply->ShareType = SMB2_SHARE_TYPE_DISK;
  Reply->ShareFlags = 0x800;
  Reply->MaximalAccess = 0x001f01ff;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(hex_to_bytes(reply_hex), body);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_TREE_CONNECT, true, 0, hex_to_bytes(reply_hex), msg));
  NetSmb2TreeconnectReply *DecodedReply = msg.body_as<NetSmb2TreeconnectReply>();
  TESTCHECK(DecodedReply && DecodedReply->ShareType() == SMB2_SHARE_TYPE_DISK && DecodedReply->MaximalAccess() == 0x001f01ff);

  // BAD_NETWORK_NAME answers with an error body under the same command
  TESTSTATUS(NetStatusOk, decode_body(SMB2_TREE_CONNECT, true, SMB2_STATUS_BAD_NETWORK_NAME, hex_to_bytes("0900000000000000"), msg));
  TESTCHECK(msg.carries_error_body() && msg.body_as<NetSmb2ErrorReply>() != 0);
  TESTCHECK(msg.Header.Command() == SMB2_TREE_CONNECT);
}

static void test_minimum_commands(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing four byte commands *** " << endl;
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(new NetSmb2EchoCmd(), false, 0, body));
  TESTBYTES(hex_to_bytes("04000000"), body);
  TESTSTATUS(NetStatusOk, encode_body(new NetSmb2LogoffCmd(), false, 0, body));
  TESTBYTES(hex_to_bytes("04000000"), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_TREE_DISCONNECT, true, 0, hex_to_bytes("04000000"), msg));
  TESTCHECK(msg.body_as<NetSmb2DisconnectReply>() != 0);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CANCEL, false, 0, hex_to_bytes("04000000"), msg));
  TESTCHECK(msg.body_as<NetSmb2CancelCmd>() != 0);
  // Reserved is not checked on decode
  TESTSTATUS(NetStatusOk, decode_body(SMB2_LOGOFF, false, 0, hex_to_bytes("04000100"), msg));
}

int run_session_tests()
{
  NetWireTestSuite Suite("session");
  test_session_setup(Suite);
  test_tree_connect(Suite);
  test_minimum_commands(Suite);
  return Suite.finish();
}

// ===========================================================================
// Close, flush, read, write, lock
// ===========================================================================

static void test_close_flush(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing close and flush *** " << endl;
  std::vector<byte> body;
  NetSmb2FlushCmd *Flush = new NetSmb2FlushCmd();
  Flush->FileId.set_ids(0x0000000c00000414ULL, 0x0000000c00100051ULL);
  TESTSTATUS(NetStatusOk, encode_body(Flush, false, 0, body));
  TESTBYTES(hex_to_bytes("1800000000000000140400000c000000510010000c000000"), body);
  TESTSTATUS(NetStatusOk, encode_body(new NetSmb2FlushReply(), true, 0, body));
  TESTBYTES(hex_to_bytes("04000000"), body);

  NetSmb2CloseCmd *Close = new NetSmb2CloseCmd();
  Close->Flags = SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB;
  Close->FileId.set_ids(0x0000000c00000414ULL, 0x0000000c00100051ULL);
  TESTSTATUS(NetStatusOk, encode_body(Close, false, 0, body));
  TESTBYTES(hex_to_bytes("1800 0100 00000000 140400000c000000510010000c000000"), body);

  NetSmb2CloseReply *Reply = new NetSmb2CloseReply();
  Reply->Flags = SMB2_CLOSE_FLAG_POSTQUERY_ATTRIB;
  Reply->CreationTime = 133783827154208828ULL;
  Reply->EndofFile = 22;
  Reply->AllocationSize = 24;
  Reply->FileAttributes = 0x20;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTCHECK(body.size() == 60);
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CLOSE, true, 0, body, msg));
  NetSmb2CloseReply *Decoded = msg.body_as<NetSmb2CloseReply>();
  TESTCHECK(Decoded && Decoded->CreationTime() == 133783827154208828ULL && Decoded->EndofFile() == 22 && Decoded->FileAttributes() == 0x20);
}

static void test_read(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing read *** " << endl;
  const char *request_hex = "31000000403020100c0b0a0908070605030300000c000000c50000000c0000000100000000000000000000000000000000";
  NetSmb2ReadCmd *Cmd = new NetSmb2ReadCmd();
  Cmd->Length = 0x10203040;
  Cmd->Offset = 0x05060708090a0b0cULL;
  Cmd->FileId.set_ids(0x0000000c00000303ULL, 0x0000000c000000c5ULL);
  Cmd->MinimumCount = 1;
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_READ, false, 0, hex_to_bytes(request_hex), msg));
  NetSmb2ReadCmd *Decoded = msg.body_as<NetSmb2ReadCmd>();
  TESTCHECK(Decoded && Decoded->Offset() == 0x05060708090a0b0cULL && Decoded->FileId.volatile_id() == 0x0000000c000000c5ULL);

  const char *reply_hex = "11005000060000000000000000000000626262626262";
  NetSmb2ReadReply *Reply = new NetSmb2ReadReply();
  Reply->Data = hex_to_bytes("626262626262");
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(hex_to_bytes(reply_hex), body);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_READ, true, 0, hex_to_bytes(reply_hex), msg));
  NetSmb2ReadReply *DecodedReply = msg.body_as<NetSmb2ReadReply>();
  TESTCHECK(DecodedReply && DecodedReply->DataOffset() == 0x50 && DecodedReply->DataLength() == 6);
  if (DecodedReply)
    TESTBYTES(hex_to_bytes("626262626262"), DecodedReply->Data());

  // Data offset pointing into the fixed part of the reply
  std::vector<byte> overlapping = hex_to_bytes(reply_hex);
  overlapping[2] = 0x48;
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_READ, true, 0, overlapping, msg));

  std::vector<byte> too_long = hex_to_bytes(reply_hex);
  too_long[4] = 7;
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_READ, true, 0, too_long, msg));

  // A successful read carries data
  const char *empty_hex = "11005000000000000000000000000000";
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_READ, true, 0, hex_to_bytes(empty_hex), msg));
  TESTSTATUS(NetStatusBadCallParms, encode_body(new NetSmb2ReadReply(), true, 0, body));

  // Message mode pipe read that filled the buffer
  TESTSTATUS(NetStatusOk, decode_body(SMB2_READ, true, SMB2_STATUS_BUFFER_OVERFLOW, hex_to_bytes(reply_hex), msg));
  DecodedReply = msg.body_as<NetSmb2ReadReply>();
  TESTCHECK(DecodedReply && DecodedReply->DataLength() == 6);
  // Other commands report it with an error body
  TESTSTATUS(NetStatusOk, decode_body(SMB2_WRITE, true, SMB2_STATUS_BUFFER_OVERFLOW, hex_to_bytes("0900000000000000"), msg));
  TESTCHECK(msg.carries_error_body() && msg.body_as<NetSmb2ErrorReply>() != 0);
}

static void test_write(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing write *** " << endl;
  // Header only capture, the 22 data bytes were not kept
  const char *request_hex = "3100700016000000cdab341200000000140400000c000000510010000c00000000000000000000000000000000000000";
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_WRITE, false, 0, hex_to_bytes(request_hex), msg));
  NetSmb2WriteCmd *Decoded = msg.body_as<NetSmb2WriteCmd>();
  TESTCHECK(Decoded && Decoded->Length() == 22 && Decoded->Offset() == 0x1234abcdULL && Decoded->Data.size() == 0);
  TESTCHECK(Decoded && Decoded->FileId.persistent_id() == 0x0000000c00000414ULL);

  NetSmb2WriteCmd *Cmd = new NetSmb2WriteCmd();
  Cmd->Length = 22;
  Cmd->Offset = 0x1234abcdULL;
  Cmd->FileId.set_ids(0x0000000c00000414ULL, 0x0000000c00100051ULL);
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);

  // Length follows the data, and decode keeps only Length bytes
  Cmd = new NetSmb2WriteCmd();
  Cmd->Data = hex_to_bytes("68656c6c6f");
  Cmd->Flags = SMB2_WRITEFLAG_WRITE_THROUGH;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTCHECK(body.size() == 53 && body[2] == 0x70 && body[4] == 5);
  body.push_back(0xee);
  body.push_back(0xee);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_WRITE, false, 0, body, msg));
  Decoded = msg.body_as<NetSmb2WriteCmd>();
  TESTCHECK(Decoded && Decoded->Flags() == SMB2_WRITEFLAG_WRITE_THROUGH);
  if (Decoded)
    TESTBYTES(hex_to_bytes("68656c6c6f"), Decoded->Data());

  // Length beyond the data that is present
  std::vector<byte> short_data(body.begin(), body.begin() + 52);
  short_data[4] = 100;
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_WRITE, false, 0, short_data, msg));

  const char *reply_hex = "11000000afbaefbe0000000000000000";
  NetSmb2WriteReply *Reply = new NetSmb2WriteReply();
  Reply->Count = 0xbeefbaaf;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(hex_to_bytes(reply_hex), body);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_WRITE, true, 0, hex_to_bytes(reply_hex), msg));
  NetSmb2WriteReply *DecodedReply = msg.body_as<NetSmb2WriteReply>();
  TESTCHECK(DecodedReply && DecodedReply->Count() == 0xbeefbaaf);
}

static void test_lock(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing lock *** " << endl;
  const char *request_hex = "30000100 00000000 0100000000000000 0200000000000000 0001000000000000 1000000000000000 12000000 00000000";
  NetSmb2LockCmd *Cmd = new NetSmb2LockCmd();
  Cmd->FileId.set_ids(1, 2);
  Cmd->Locks.push_back(NetSmb2LockElement(0x100, 0x10, SMB2_LOCKFLAG_EXCLUSIVE_LOCK|SMB2_LOCKFLAG_FAIL_IMMEDIATELY));
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);

  NetSmb2LockCmd *Two = new NetSmb2LockCmd();
  Two->Locks.push_back(NetSmb2LockElement(0, 1, SMB2_LOCKFLAG_SHARED_LOCK));
  Two->Locks.push_back(NetSmb2LockElement(8, 8, SMB2_LOCKFLAG_UNLOCK));
  TESTSTATUS(NetStatusOk, encode_body(Two, false, 0, body));
  TESTCHECK(body.size() == 72 && body[2] == 2);
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_LOCK, false, 0, body, msg));
  NetSmb2LockCmd *Decoded = msg.body_as<NetSmb2LockCmd>();
  TESTCHECK(Decoded && Decoded->Locks.size() == 2);
  if (Decoded && Decoded->Locks.size() == 2)
    TESTCHECK(Decoded->Locks[1].Offset() == 8 && Decoded->Locks[1].Flags() == SMB2_LOCKFLAG_UNLOCK);

  // LockCount claims more elements than the message holds
  std::vector<byte> overcounted = hex_to_bytes(request_hex);
  overcounted[2] = 3;
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_LOCK, false, 0, overcounted, msg));

  TESTSTATUS(NetStatusOk, decode_body(SMB2_LOCK, true, 0, hex_to_bytes("04000000"), msg));
  TESTCHECK(msg.body_as<NetSmb2LockReply>() != 0);
}

int run_fileio_tests()
{
  NetWireTestSuite Suite("fileio");
  test_close_flush(Suite);
  test_read(Suite);
  test_write(Suite);
  test_lock(Suite);
  return Suite.finish();
}

// ===========================================================================
// IOCTL
// ===========================================================================

static const char *pipe_request_data =
  "0500000310000000980000000300000080000000010039000000000013f8a58f166fb54482"
  "c28f2dae140df50000000001000000000000000000020000000000010000000000000000000200"
  "000000000500000000000000010500000000000515000000173da72e955653f915dff280e90300"
  "00000000000000000000000000000000000000000001000000000000000000000002000000";

static const char *pipe_reply_data =
  "05000203100000000401000003000000ec00000001000000000002000000000001000000000000"
  "000000020000000000200000000000000001000000000000000c000e000000000000000200000000"
  "000000020000000000070000000000000000000000000000000600000000000000410056004900"
  "560056004d00000000000400000000000000010400000000000515000000173da72e955653f915"
  "dff28001000000000000000000020000000000010000000000000001000000000000000a000c00"
  "000000000000020000000000000000000000000006000000000000000000000000000000050000"
  "000000000061007600690076006e0000000100000000000000";

static const char *ioctl_request_fixed = "3900000017c01100280500000c000000850000000c0000007800000098000000000000000000000000000000000400000100000000000000";
static const char *ioctl_reply_fixed   = "3100000017c01100280500000c000000850000000c000000700000000000000070000000040100000000000000000000";

static void test_ioctl_pipe_transceive(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing ioctl pipe transceive *** " << endl;
  std::vector<byte> request = hex_to_bytes(ioctl_request_fixed);
  std::vector<byte> request_data = hex_to_bytes(pipe_request_data);
  TESTCHECK(request_data.size() == 152);
  request.insert(request.end(), request_data.begin(), request_data.end());

  NetSmb2IoctlCmd *Cmd = new NetSmb2IoctlCmd();
  Cmd->FileId.set_ids(0x0000000c00000528ULL, 0x0000000c00000085ULL);
  Cmd->MaxOutputResponse = 0x400;
  Cmd->Flags = SMB2_0_IOCTL_IS_FSCTL;
  NetSmb2PipeTransceiveRequest *Pipe = new NetSmb2PipeTransceiveRequest();
  Pipe->Data = request_data;
  Cmd->Input.assign(Pipe);
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(request, body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_IOCTL, false, 0, request, msg));
  NetSmb2IoctlCmd *Decoded = msg.body_as<NetSmb2IoctlCmd>();
  TESTCHECK(Decoded && Decoded->CtlCode() == FSCTL_PIPE_TRANSCEIVE);
  NetSmb2PipeTransceiveRequest *DecodedPipe = Decoded ? Decoded->input_as<NetSmb2PipeTransceiveRequest>() : 0;
  TESTCHECK(DecodedPipe != 0);
  if (DecodedPipe)
    TESTBYTES(request_data, DecodedPipe->Data());

  // A device ioctl that reuses the control code is not a named pipe transceive
  std::vector<byte> device_ioctl = request;
  device_ioctl[48] = 0;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_IOCTL, false, 0, device_ioctl, msg));
  Decoded = msg.body_as<NetSmb2IoctlCmd>();
  TESTCHECK(Decoded && Decoded->Flags() == 0 && Decoded->input_as<NetSmb2PipeTransceiveRequest>() == 0);
  NetWireOpaqueVariant *DeviceInput = Decoded ? Decoded->input_as<NetWireOpaqueVariant>() : 0;
  TESTCHECK(DeviceInput != 0);
  if (DeviceInput)
    TESTBYTES(request_data, DeviceInput->Data());

  // Requests carry no output buffer
  std::vector<byte> with_output = request;
  with_output[36] = 0x78;
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_IOCTL, false, 0, with_output, msg));

  std::vector<byte> reply = hex_to_bytes(ioctl_reply_fixed);
  std::vector<byte> reply_data = hex_to_bytes(pipe_reply_data);
  TESTCHECK(reply_data.size() == 260);
  reply.insert(reply.end(), reply_data.begin(), reply_data.end());

  NetSmb2IoctlReply *Reply = new NetSmb2IoctlReply();
  Reply->CtlCode = FSCTL_PIPE_TRANSCEIVE;
  Reply->FileId.set_ids(0x0000000c00000528ULL, 0x0000000c00000085ULL);
  Reply->OutBuffer = reply_data;
  std::vector<byte> reply_file_id = file_id_bytes(Reply->FileId);
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(reply, body);

  TESTSTATUS(NetStatusOk, decode_body(SMB2_IOCTL, true, 0, reply, msg));
  NetSmb2IoctlReply *DecodedReply = msg.body_as<NetSmb2IoctlReply>();
  TESTCHECK(DecodedReply && DecodedReply->InBuffer.size() == 0 && DecodedReply->OutputCount() == 260);
  if (DecodedReply)
  {
    TESTBYTES(reply_data, DecodedReply->OutBuffer());
    TESTBYTES(reply_file_id, file_id_bytes(DecodedReply->FileId));
  }

  // A pipe message longer than MaxOutputResponse comes back whole up to the limit
  TESTSTATUS(NetStatusOk, decode_body(SMB2_IOCTL, true, SMB2_STATUS_BUFFER_OVERFLOW, reply, msg));
  TESTCHECK(!msg.carries_error_body() && msg.body_as<NetSmb2ErrorReply>() == 0);
  DecodedReply = msg.body_as<NetSmb2IoctlReply>();
  TESTCHECK(DecodedReply && DecodedReply->OutBuffer.size() == 260);
  Reply = new NetSmb2IoctlReply();
  Reply->CtlCode = FSCTL_PIPE_TRANSCEIVE;
  Reply->OutBuffer = reply_data;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, SMB2_STATUS_BUFFER_OVERFLOW, body));
  TESTCHECK(body.size() == reply.size());

  // Output buffer that does not follow the input buffer
  const char *gap_hex = "3100 0000 17c01100 00000000000000000000000000000000 70000000 00000000 74000000 04000000 00000000 00000000 0102030405060708";
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_IOCTL, true, 0, hex_to_bytes(gap_hex), msg));
}

static void test_ioctl_validate_negotiate(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing ioctl validate negotiate info *** " << endl;
  static const word dialects[] = { SMB2_DIALECT_2002, SMB2_DIALECT_2100, SMB2_DIALECT_3000, SMB2_DIALECT_3002 };
  NetSmb2IoctlCmd *Cmd = new NetSmb2IoctlCmd();
  Cmd->FileId.set_ids(0xffffffffffffffffULL, 0xffffffffffffffffULL);
  Cmd->MaxOutputResponse = 24;
  Cmd->Flags = SMB2_0_IOCTL_IS_FSCTL;
  NetSmb2ValidateNegotiateInfoRequest *Validate = new NetSmb2ValidateNegotiateInfoRequest();
  Validate->Capabilities = 0x7f;
  Validate->Guid = &hex_to_bytes("df0d2ec1dd43f0118b87000c29801682")[0];
  Validate->SecurityMode = SMB2_NEGOTIATE_SIGNING_ENABLED;
  for (int i = 0; i < 4; i++)
    Validate->Dialects.push_back(NetWireword(dialects[i]));
  Cmd->Input.assign(Validate);

  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTCHECK(body.size() == 56 + 32);
  TESTBYTES(hex_to_bytes("04021400"), std::vector<byte>(body.begin() + 4, body.begin() + 8));
  TESTBYTES(hex_to_bytes("7800000020000000"), std::vector<byte>(body.begin() + 24, body.begin() + 32));
  TESTBYTES(hex_to_bytes("0100 0400 0202 1002 0003 0203"), std::vector<byte>(body.begin() + 76, body.end()));

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_IOCTL, false, 0, body, msg));
  NetSmb2IoctlCmd *Decoded = msg.body_as<NetSmb2IoctlCmd>();
  NetSmb2ValidateNegotiateInfoRequest *DecodedValidate = Decoded ? Decoded->input_as<NetSmb2ValidateNegotiateInfoRequest>() : 0;
  TESTCHECK(DecodedValidate != 0);
  if (DecodedValidate)
  {
    TESTCHECK(DecodedValidate->Capabilities() == 0x7f && DecodedValidate->DialectCount() == 4);
    TESTCHECK(DecodedValidate->Dialects.size() == 4 && DecodedValidate->Dialects[3]() == SMB2_DIALECT_3002);
  }

  // Unregistered control codes keep their input bytes
  NetSmb2IoctlCmd *Referral = new NetSmb2IoctlCmd();
  Referral->Input.assign(netwire_make_opaque_variant(smb2_ioctl_key(FSCTL_DFS_GET_REFERRALS, SMB2_0_IOCTL_IS_FSCTL)));
  Referral->Input.variant_as<NetWireOpaqueVariant>()->Data = hex_to_bytes("04005c00");
  TESTSTATUS(NetStatusOk, encode_body(Referral, false, 0, body));
  TESTSTATUS(NetStatusOk, decode_body(SMB2_IOCTL, false, 0, body, msg));
  Decoded = msg.body_as<NetSmb2IoctlCmd>();
  TESTCHECK(Decoded && Decoded->CtlCode() == FSCTL_DFS_GET_REFERRALS);
  NetWireOpaqueVariant *Opaque = Decoded ? Decoded->input_as<NetWireOpaqueVariant>() : 0;
  TESTCHECK(Opaque != 0);
  if (Opaque)
    TESTBYTES(hex_to_bytes("04005c00"), Opaque->Data());
}

int run_ioctl_tests()
{
  NetWireTestSuite Suite("ioctl");
  test_ioctl_pipe_transceive(Suite);
  test_ioctl_validate_negotiate(Suite);
  return Suite.finish();
}

// ===========================================================================
// CHANGE_NOTIFY
// ===========================================================================

static const char *notify_azure_reply_body =
  "090048006001000018000000010000000c000000310031002e0074007800740028000000010000"
  "001c0000006b00650072006e0065006c002e00620069006e002e00740069006c00780000000100"
  "00006c0000006500630032002d0033002d00370030002d003200320032002d00360039002e0065"
  "0075002d00630065006e007400720061006c002d0031002e0063006f006d007000750074006500"
  "2e0061006d0061007a006f006e006100770073002e0063006f006d002e00720064007000800000"
  "00010000006e0000006500630032002d00310038002d003100390038002d00350031002d003900"
  "38002e00650075002d00630065006e007400720061006c002d0031002e0063006f006d00700075"
  "00740065002e0061006d0061007a006f006e006100770073002e0063006f006d002e0072006400"
  "70006f557361676500000000010000001600000054006500730074002000440043002e00720064"
  "007000726e65744567";

static void test_notify_request(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing change notify request *** " << endl;
  const char *request_hex = "2000000000080000d10500000c000000190000000c0000001700000000000000";
  NetSmb2NotifyCmd *Cmd = new NetSmb2NotifyCmd();
  Cmd->OutputBufferLength = 0x800;
  Cmd->FileId.set_ids(0x0000000c000005d1ULL, 0x0000000c00000019ULL);
  Cmd->CompletionFilter = FILE_NOTIFY_CHANGE_FILE_NAME|FILE_NOTIFY_CHANGE_DIR_NAME|FILE_NOTIFY_CHANGE_ATTRIBUTES|FILE_NOTIFY_CHANGE_LAST_WRITE;
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);
}

static void test_notify_reply(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing change notify reply *** " << endl;
  const char *reply_hex = "09004800340000002000000004000000140000004e0065007700200066006f006c006400650072000000000005000000080000006a00640073006100";
  NetSmb2NotifyReply *Reply = new NetSmb2NotifyReply();
  Reply->Notifications.push_back(ms_FILE_NOTIFY_INFORMATION(FILE_ACTION_RENAMED_OLD_NAME, "New folder"));
  Reply->Notifications.push_back(ms_FILE_NOTIFY_INFORMATION(FILE_ACTION_RENAMED_NEW_NAME, "jdsa"));
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(hex_to_bytes(reply_hex), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CHANGE_NOTIFY, true, 0, hex_to_bytes(reply_hex), msg));
  NetSmb2NotifyReply *Decoded = msg.body_as<NetSmb2NotifyReply>();
  TESTCHECK(Decoded && Decoded->Notifications.size() == 2);
  if (Decoded && Decoded->Notifications.size() == 2)
  {
    TESTCHECK(Decoded->Notifications[0].FileName == "New folder");
    TESTCHECK(Decoded->Notifications[1].Action() == FILE_ACTION_RENAMED_NEW_NAME);
  }

  // Completed with nothing to report
  NetSmb2NotifyReply *Empty = new NetSmb2NotifyReply();
  TESTSTATUS(NetStatusOk, encode_body(Empty, true, 0, body));
  TESTBYTES(hex_to_bytes("0900000000000000"), body);
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CHANGE_NOTIFY, true, 0, body, msg));
  Decoded = msg.body_as<NetSmb2NotifyReply>();
  TESTCHECK(Decoded && Decoded->Notifications.size() == 0);

  // The interim STATUS_PENDING answer is an error body
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CHANGE_NOTIFY, true, SMB2_STATUS_PENDING, hex_to_bytes("0900000000000000"), msg));
  TESTCHECK(msg.body_as<NetSmb2ErrorReply>() != 0);
}

static void test_notify_azure_reply(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing change notify reply with slack *** " << endl;
  static const char *names[] = {
    "11.txt",
    "kernel.bin.til",
    "ec2-3-70-222-69.eu-central-1.compute.amazonaws.com.rdp",
    "ec2-18-198-51-98.eu-central-1.compute.amazonaws.com.rdp",
    "Test DC.rdp"
  };
  std::vector<byte> reply = hex_to_bytes(notify_azure_reply_body);
  TESTCHECK(reply.size() == 360);
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CHANGE_NOTIFY, true, 0, reply, msg));
  NetSmb2NotifyReply *Decoded = msg.body_as<NetSmb2NotifyReply>();
  TESTCHECK(Decoded && Decoded->OutputBufferLength() == 0x160);
  TESTCHECK(Decoded && Decoded->Notifications.size() == 5);
  if (Decoded && Decoded->Notifications.size() == 5)
  {
    for (int i = 0; i < 5; i++)
    {
      TESTCHECK(Decoded->Notifications[i].FileName == names[i]);
      TESTCHECK(Decoded->Notifications[i].Action() == FILE_ACTION_ADDED);
    }
  }
}

static void test_server_to_client_notification(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing server to client notification *** " << endl;
  const char *session_closed_hex = "0c000000 00000000 00000000";
  NetSmb2ServerToClientNotification *Notification = new NetSmb2ServerToClientNotification();
  Notification->Notification.assign(new NetSmb2NotifySessionClosed());
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Notification, true, 0, body));
  TESTBYTES(hex_to_bytes(session_closed_hex), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_SERVER_TO_CLIENT_NOTIFICATION, true, 0, hex_to_bytes(session_closed_hex), msg));
  NetSmb2ServerToClientNotification *Decoded = msg.body_as<NetSmb2ServerToClientNotification>();
  TESTCHECK(Decoded && Decoded->NotificationType() == SMB2_NOTIFY_SESSION_CLOSED);
  TESTCHECK(Decoded && Decoded->notification_as<NetSmb2NotifySessionClosed>() != 0);

  std::vector<byte> unknown_type = hex_to_bytes(session_closed_hex);
  unknown_type[4] = 1;
  TESTSTATUS(NetStatusUnknownDiscriminant, decode_body(SMB2_SERVER_TO_CLIENT_NOTIFICATION, true, 0, unknown_type, msg));
  std::vector<byte> short_body(body.begin(), body.begin() + 10);
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_SERVER_TO_CLIENT_NOTIFICATION, true, 0, short_body, msg));
}

int run_notify_tests()
{
  NetWireTestSuite Suite("notify");
  test_notify_request(Suite);
  test_notify_reply(Suite);
  test_notify_azure_reply(Suite);
  test_server_to_client_notification(Suite);
  return Suite.finish();
}

// ===========================================================================
// SET_INFO
// ===========================================================================

static void test_setinfo_rename(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing set info rename *** " << endl;
  const char *request_hex =
    "2100010a3a0000006000000000000000420000000e000000050010000e0000000000000000000000"
    "000000000000000026000000680065006c006c006f005c006d0079004e0065007700460069006c0065"
    "002e00740078007400";
  NetSmb2SetinfoCmd *Cmd = new NetSmb2SetinfoCmd();
  Cmd->FileId.set_ids(0x0000000e00000042ULL, 0x0000000e00100005ULL);
  ms_FILE_RENAME_INFORMATION *Rename = new ms_FILE_RENAME_INFORMATION();
  Rename->FileName = "hello\\myNewFile.txt";
  Cmd->Buffer.assign(Rename);
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_SET_INFO, false, 0, hex_to_bytes(request_hex), msg));
  NetSmb2SetinfoCmd *Decoded = msg.body_as<NetSmb2SetinfoCmd>();
  TESTCHECK(Decoded && Decoded->InfoType() == SMB2_0_INFO_FILE && Decoded->FileInfoClass() == SMB2_FILE_RENAME_INFO);
  ms_FILE_RENAME_INFORMATION *DecodedRename = Decoded ? Decoded->buffer_as<ms_FILE_RENAME_INFORMATION>() : 0;
  TESTCHECK(DecodedRename && DecodedRename->FileName == "hello\\myNewFile.txt" && DecodedRename->FileNameLength() == 38);

  TESTSTATUS(NetStatusOk, encode_body(new NetSmb2SetinfoReply(), true, 0, body));
  TESTBYTES(hex_to_bytes("0200"), body);
}

static void test_setinfo_classes(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing set info classes *** " << endl;
  std::vector<byte> body;
  NetSmb2PlainMessage msg;
  {
    NetSmb2SetinfoCmd *Cmd = new NetSmb2SetinfoCmd();
    ms_FILE_DISPOSITION_INFORMATION *Disposition = new ms_FILE_DISPOSITION_INFORMATION();
    Disposition->DeletePending = 1;
    Cmd->Buffer.assign(Disposition);
    TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
    TESTCHECK(body.size() == 33 && body[2] == SMB2_0_INFO_FILE && body[3] == SMB2_FILE_DISPOSITION_INFO && body[4] == 1 && body[32] == 1);
    TESTSTATUS(NetStatusOk, decode_body(SMB2_SET_INFO, false, 0, body, msg));
    NetSmb2SetinfoCmd *Decoded = msg.body_as<NetSmb2SetinfoCmd>();
    ms_FILE_DISPOSITION_INFORMATION *DecodedDisposition = Decoded ? Decoded->buffer_as<ms_FILE_DISPOSITION_INFORMATION>() : 0;
    TESTCHECK(DecodedDisposition && DecodedDisposition->DeletePending() == 1);
  }
  {
    NetSmb2SetinfoCmd *Cmd = new NetSmb2SetinfoCmd();
    ms_FILE_END_OF_FILE_INFORMATION *EndOfFile = new ms_FILE_END_OF_FILE_INFORMATION();
    EndOfFile->EndOfFile = 0x123456789ULL;
    Cmd->Buffer.assign(EndOfFile);
    TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
    TESTSTATUS(NetStatusOk, decode_body(SMB2_SET_INFO, false, 0, body, msg));
    NetSmb2SetinfoCmd *Decoded = msg.body_as<NetSmb2SetinfoCmd>();
    ms_FILE_END_OF_FILE_INFORMATION *DecodedEndOfFile = Decoded ? Decoded->buffer_as<ms_FILE_END_OF_FILE_INFORMATION>() : 0;
    TESTCHECK(DecodedEndOfFile && DecodedEndOfFile->EndOfFile() == 0x123456789ULL);
  }
  {
    // FileBasicInformation is not registered and travels as bytes
    std::vector<byte> basic(40, 0);
    basic[32] = 0x20;
    NetSmb2SetinfoCmd *Cmd = new NetSmb2SetinfoCmd();
    NetWireOpaqueVariant *Opaque = new NetWireOpaqueVariant(smb2_info_key(SMB2_0_INFO_FILE, SMB2_FILE_BASIC_INFO));
    Opaque->Data = basic;
    Cmd->Buffer.assign(Opaque);
    TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
    TESTCHECK(body.size() == 72 && body[3] == SMB2_FILE_BASIC_INFO && body[4] == 40);
    TESTSTATUS(NetStatusOk, decode_body(SMB2_SET_INFO, false, 0, body, msg));
    NetSmb2SetinfoCmd *Decoded = msg.body_as<NetSmb2SetinfoCmd>();
    NetWireOpaqueVariant *DecodedOpaque = Decoded ? Decoded->buffer_as<NetWireOpaqueVariant>() : 0;
    TESTCHECK(DecodedOpaque != 0);
    if (DecodedOpaque)
    {
      TESTCHECK(DecodedOpaque->discriminant_key() == smb2_info_key(SMB2_0_INFO_FILE, SMB2_FILE_BASIC_INFO));
      TESTBYTES(basic, DecodedOpaque->Data());
    }
  }
}

int run_setinfo_tests()
{
  NetWireTestSuite Suite("setinfo");
  test_setinfo_rename(Suite);
  test_setinfo_classes(Suite);
  return Suite.finish();
}

// ===========================================================================
// QUERY_DIRECTORY
// ===========================================================================

static void test_querydirectory_request(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing query directory request *** " << endl;
  const char *request_hex = "2100 25 01 00000000 0100000000000000 0200000000000000 6000 0200 00000100 2a00";
  NetSmb2QuerydirectoryCmd *Cmd = new NetSmb2QuerydirectoryCmd();
  Cmd->FileInformationClass = SMB2_QUERY_FileIdBothDirectoryInformation;
  Cmd->Flags = SMB2_QUERY_RESTART_SCANS;
  Cmd->FileId.set_ids(1, 2);
  Cmd->OutputBufferLength = 0x10000;
  Cmd->FileName = "*";
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(request_hex), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_QUERY_DIRECTORY, false, 0, hex_to_bytes(request_hex), msg));
  NetSmb2QuerydirectoryCmd *Decoded = msg.body_as<NetSmb2QuerydirectoryCmd>();
  TESTCHECK(Decoded && Decoded->FileName == "*" && Decoded->FileInformationClass() == SMB2_QUERY_FileIdBothDirectoryInformation);
}

static void test_querydirectory_reply(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing query directory reply *** " << endl;
  ms_FILE_ID_BOTH_DIR_LIST Entries;
  ms_FILE_ID_BOTH_DIR_INFORMATION First;
  First.FileName = "a.txt";
  First.EndofFile = 5;
  First.FileAttributes = 0x20;
  First.FileId = 0x1234;
  ms_FILE_ID_BOTH_DIR_INFORMATION Second;
  Second.FileName = "bb";
  Second.FileAttributes = 0x10;
  Entries.push_back(First);
  Entries.push_back(Second);

  NetSmb2QuerydirectoryReply *Reply = new NetSmb2QuerydirectoryReply();
  TESTSTATUS(NetStatusOk, Reply->encode_id_both_directory(Entries));
  TESTCHECK(Reply->Buffer.size() == 120 + 104 + 4);
  TESTBYTES(hex_to_bytes("78000000"), std::vector<byte>(Reply->Buffer().begin(), Reply->Buffer().begin() + 4));
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(hex_to_bytes("0900 4800 e4000000"), std::vector<byte>(body.begin(), body.begin() + 8));

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_QUERY_DIRECTORY, true, 0, body, msg));
  NetSmb2QuerydirectoryReply *Decoded = msg.body_as<NetSmb2QuerydirectoryReply>();
  TESTCHECK(Decoded != 0);
  if (!Decoded)
    return;
  ms_FILE_ID_BOTH_DIR_LIST DecodedEntries;
  TESTSTATUS(NetStatusOk, Decoded->decode_id_both_directory(DecodedEntries));
  TESTCHECK(DecodedEntries.size() == 2);
  if (DecodedEntries.size() == 2)
  {
    TESTCHECK(DecodedEntries[0].FileName == "a.txt" && DecodedEntries[0].EndofFile() == 5 && DecodedEntries[0].FileId() == 0x1234);
    TESTCHECK(DecodedEntries[1].FileName == "bb" && DecodedEntries[1].FileAttributes() == 0x10);
  }

  // NextEntryOffset of 116 breaks the 8 byte entry alignment
  std::vector<byte> misaligned = Decoded->Buffer();
  misaligned[0] = 0x74;
  Decoded->Buffer = misaligned;
  TESTSTATUS(NetStatusAlignmentViolation, Decoded->decode_id_both_directory(DecodedEntries));

  // STATUS_NO_MORE_FILES ends the enumeration with an error body
  TESTSTATUS(NetStatusOk, decode_body(SMB2_QUERY_DIRECTORY, true, SMB2_STATUS_NO_MORE_FILES, hex_to_bytes("0900000000000000"), msg));
  TESTCHECK(msg.body_as<NetSmb2ErrorReply>() != 0);
}

int run_querydirectory_tests()
{
  NetWireTestSuite Suite("querydirectory");
  test_querydirectory_request(Suite);
  test_querydirectory_reply(Suite);
  return Suite.finish();
}

// ===========================================================================
// Error responses
// ===========================================================================

static NetStatus encode_error(word command, dword status, NetSmb2ErrorReply *Error, std::vector<byte> &out)
{
  NetSmb2PlainMessage msg;
  msg.Header.Initialize(command, 7, 0x0000100000000011ULL);
  msg.Header.Flags = SMB2_FLAGS_SERVER_TO_REDIR;
  msg.Header.Status_ChannelSequenceReserved = status;
  msg.set_body(Error);
  return smb2wire_encode_message(msg, out);
}

static void test_error_simple(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing error response *** " << endl;
  std::vector<byte> out;
  TESTSTATUS(NetStatusOk, encode_error(SMB2_CREATE, SMB2_STATUS_ACCESS_DENIED, new NetSmb2ErrorReply(), out));
  TESTCHECK(out.size() == 72);
  if (out.size() == 72)
  {
    TESTBYTES(hex_to_bytes("0900000000000000"), std::vector<byte>(out.begin() + 64, out.end()));
    TESTBYTES(hex_to_bytes("220000c0 0500"), std::vector<byte>(out.begin() + 8, out.begin() + 14));
  }

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, smb2wire_decode_message(&out[0], (dword) out.size(), msg));
  TESTCHECK(msg.carries_error_body() && msg.Header.Command() == SMB2_CREATE);
  NetSmb2ErrorReply *Decoded = msg.body_as<NetSmb2ErrorReply>();
  TESTCHECK(Decoded && Decoded->ByteCount() == 0 && Decoded->ErrorData.wire_empty());

  // An error status needs the error body, and success rejects it
  NetSmb2PlainMessage wrong;
  wrong.Header.Initialize(SMB2_CREATE, 7, 0);
  wrong.Header.Flags = SMB2_FLAGS_SERVER_TO_REDIR;
  wrong.Header.Status_ChannelSequenceReserved = SMB2_STATUS_ACCESS_DENIED;
  wrong.set_body(new NetSmb2CreateReply());
  TESTSTATUS(NetStatusBadCallParms, smb2wire_encode_message(wrong, out));
  TESTSTATUS(NetStatusBadCallParms, encode_error(SMB2_CREATE, SMB2_NT_STATUS_SUCCESS, new NetSmb2ErrorReply(), out));

  // Raw error data when there are no contexts
  NetSmb2ErrorReply *Raw = new NetSmb2ErrorReply();
  Raw->ErrorData.Raw = hex_to_bytes("01020304");
  TESTSTATUS(NetStatusOk, encode_error(SMB2_READ, SMB2_STATUS_END_OF_FILE, Raw, out));
  TESTBYTES(hex_to_bytes("0900 00 00 04000000 01020304"), std::vector<byte>(out.begin() + 64, out.end()));
  TESTSTATUS(NetStatusOk, smb2wire_decode_message(&out[0], (dword) out.size(), msg));
  Decoded = msg.body_as<NetSmb2ErrorReply>();
  TESTCHECK(Decoded && Decoded->ErrorData.Contexts.size() == 0);
  if (Decoded)
    TESTBYTES(hex_to_bytes("01020304"), Decoded->ErrorData.Raw());

  // ByteCount past the end of the message
  std::vector<byte> truncated = out;
  truncated[68] = 9;
  TESTSTATUS(NetStatusBoundsViolation, smb2wire_decode_message(&truncated[0], (dword) truncated.size(), msg));
}

static void test_error_contexts(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing error response contexts *** " << endl;
  NetSmb2ErrorReply *Error = new NetSmb2ErrorReply();
  NetSmb2ErrorContext First;
  First.ErrorId = 0;
  First.ErrorContextData = hex_to_bytes("010203");
  NetSmb2ErrorContext Second;
  Second.ErrorId = 0x72727245;
  Second.ErrorContextData = hex_to_bytes("aabbccdd");
  Error->ErrorData.Contexts.push_back(First);
  Error->ErrorData.Contexts.push_back(Second);
  std::vector<byte> out;
  TESTSTATUS(NetStatusOk, encode_error(SMB2_CREATE, SMB2_STATUS_OBJECT_NAME_NOT_FOUND, Error, out));
  // 11 bytes, 5 bytes of padding, 12 bytes
  TESTCHECK(out.size() == 64 + 8 + 28);
  if (out.size() == 100)
  {
    TESTBYTES(hex_to_bytes("0900 02 00 1c000000"), std::vector<byte>(out.begin() + 64, out.begin() + 72));
    TESTBYTES(hex_to_bytes("03000000 00000000 010203"), std::vector<byte>(out.begin() + 72, out.begin() + 83));
  }

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, smb2wire_decode_message(&out[0], (dword) out.size(), msg));
  NetSmb2ErrorReply *Decoded = msg.body_as<NetSmb2ErrorReply>();
  TESTCHECK(Decoded && Decoded->ErrorContextCount() == 2 && Decoded->ErrorData.Contexts.size() == 2);
  if (Decoded && Decoded->ErrorData.Contexts.size() == 2)
  {
    TESTCHECK(Decoded->ErrorData.Contexts[1].ErrorId() == 0x72727245);
    TESTBYTES(hex_to_bytes("aabbccdd"), Decoded->ErrorData.Contexts[1].ErrorContextData());
  }
}

int run_error_tests()
{
  NetWireTestSuite Suite("error");
  test_error_simple(Suite);
  test_error_contexts(Suite);
  return Suite.finish();
}
