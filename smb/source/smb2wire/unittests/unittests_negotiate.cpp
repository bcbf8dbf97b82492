//
// unittests_negotiate.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB2 NEGOTIATE request and reply, with and without negotiate contexts.
//

#include "unittests.hpp"

static const char *negotiate_request_body =
  "2400050001000000ff000000df0d2ec1dd43f0118b87000c298016827000000006000000"
  "0202100200030203110300000100260000000000010020000100ed006c304e332890b2bd98"
  "617b5ad9ef075994154673696280ffcc0f1291a15d000002000a0000000000040002000100"
  "0400030000000000000003001200000000000500000001000000040002000300010005000000"
  "000000000800080000000000030002000100000005001200000000006c006f00630061006c00"
  "68006f007300740000000000000007000c0000000000020000000000000001000200";

static const char *negotiate_reply_body =
  "4100010011030500b921f8e01507aa41be3867febf5e2e112f00000000008000000080000000"
  "8000a876d878c569db01000000000000000080002a00b0000000602806062b0601050502a01e"
  "301ca01a3018060a2b06010401823702021e060a2b06010401823702020a0000000000000100"
  "260000000000010020000100d5671b24a1e9ccc893f5555a3103435a852bc3cb1ad32dc51f92"
  "806ef3fb4dd40000020004000000000001000200000000000800040000000000010002000000"
  "000007000c00000000000200000000000000010002000000000003000c000000000002000000"
  "0100000002000400";

static void add_words(NetWireArray<NetWireword> &Array, const word *values, int count)
{
  for (int i = 0; i < count; i++)
    Array.push_back(NetWireword(values[i]));
}

static bool words_match(const NetWireArray<NetWireword> &Array, const word *values, int count)
{
  if (Array.size() != (size_t) count)
    return false;
  for (int i = 0; i < count; i++)
    if (Array[i]() != values[i])
      return false;
  return true;
}

static NetSmb2NegotiateCmd *build_negotiate_request()
{
  static const word dialects[]     = { SMB2_DIALECT_2002, SMB2_DIALECT_2100, SMB2_DIALECT_3000, SMB2_DIALECT_3002, SMB2_DIALECT_3110 };
  static const word ciphers[]      = { SMB2_ENCRYPTION_AES128_GCM, SMB2_ENCRYPTION_AES128_CCM, SMB2_ENCRYPTION_AES256_GCM, SMB2_ENCRYPTION_AES256_CCM };
  static const word compressors[]  = { SMB2_COMPRESSION_PATTERN_V1, SMB2_COMPRESSION_LZ77, SMB2_COMPRESSION_LZ77_HUFFMAN, SMB2_COMPRESSION_LZNT1, SMB2_COMPRESSION_LZ4 };
  static const word signers[]      = { SMB2_SIGNING_AES_GMAC, SMB2_SIGNING_AES_CMAC, SMB2_SIGNING_HMAC_SHA256 };
  static const word transforms[]   = { SMB2_RDMA_TRANSFORM_ENCRYPTION, SMB2_RDMA_TRANSFORM_SIGNING };
  static const word hashes[]       = { SMB2_PREAUTH_INTEGRITY_SHA512 };

  NetSmb2NegotiateCmd *Cmd = new NetSmb2NegotiateCmd();
  Cmd->SecurityMode = SMB2_NEGOTIATE_SIGNING_ENABLED;
  Cmd->Capabilities = 0xff;
  Cmd->ClientGuid = &hex_to_bytes("df0d2ec1dd43f0118b87000c29801682")[0];
  for (int i = 0; i < 5; i++)
    Cmd->add_dialect(dialects[i]);

  NetSmb2PreauthIntegrityCapabilities *Preauth = new NetSmb2PreauthIntegrityCapabilities();
  add_words(Preauth->HashAlgorithms, hashes, 1);
  Preauth->Salt = hex_to_bytes("ed006c304e332890b2bd98617b5ad9ef075994154673696280ffcc0f1291a15d");
  Cmd->NegotiateContexts.push_back(NetSmb2NegotiateContext(Preauth));

  NetSmb2EncryptionCapabilities *Encryption = new NetSmb2EncryptionCapabilities();
  add_words(Encryption->Ciphers, ciphers, 4);
  Cmd->NegotiateContexts.push_back(NetSmb2NegotiateContext(Encryption));

  NetSmb2CompressionCapabilities *Compression = new NetSmb2CompressionCapabilities();
  Compression->Flags = SMB2_COMPRESSION_CAPABILITIES_FLAG_CHAINED;
  add_words(Compression->CompressionAlgorithms, compressors, 5);
  Cmd->NegotiateContexts.push_back(NetSmb2NegotiateContext(Compression));

  NetSmb2SigningCapabilities *Signing = new NetSmb2SigningCapabilities();
  add_words(Signing->SigningAlgorithms, signers, 3);
  Cmd->NegotiateContexts.push_back(NetSmb2NegotiateContext(Signing));

  NetSmb2NetnameNegotiateContextId *Netname = new NetSmb2NetnameNegotiateContextId();
  Netname->NetName = "localhost";
  Cmd->NegotiateContexts.push_back(NetSmb2NegotiateContext(Netname));

  NetSmb2RdmaTransformCapabilities *Rdma = new NetSmb2RdmaTransformCapabilities();
  add_words(Rdma->RdmaTransformIds, transforms, 2);
  Cmd->NegotiateContexts.push_back(NetSmb2NegotiateContext(Rdma));
  return Cmd;
}

static void test_negotiate_request(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing negotiate request *** " << endl;
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(build_negotiate_request(), false, 0, body));
  TESTBYTES(hex_to_bytes(negotiate_request_body), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_NEGOTIATE, false, 0, hex_to_bytes(negotiate_request_body), msg));
  NetSmb2NegotiateCmd *Cmd = msg.body_as<NetSmb2NegotiateCmd>();
  TESTCHECK(Cmd != 0);
  if (!Cmd)
    return;
  TESTCHECK(Cmd->Dialects.size() == 5);
  TESTCHECK(Cmd->offers_dialect(SMB2_DIALECT_3110));
  TESTCHECK(!Cmd->offers_dialect(SMB2_DIALECT_WILD));
  TESTCHECK(Cmd->NegotiateContextOffset() == 0x70);
  TESTCHECK(Cmd->NegotiateContexts.size() == 6);
  if (Cmd->NegotiateContexts.size() != 6)
    return;
  NetSmb2PreauthIntegrityCapabilities *Preauth = Cmd->NegotiateContexts[0].data_as<NetSmb2PreauthIntegrityCapabilities>();
  TESTCHECK(Preauth && Preauth->HashAlgorithms.size() == 1 && Preauth->Salt.size() == 32);
  static const word ciphers[] = { 2, 1, 4, 3 };
  NetSmb2EncryptionCapabilities *Encryption = Cmd->NegotiateContexts[1].data_as<NetSmb2EncryptionCapabilities>();
  TESTCHECK(Encryption && words_match(Encryption->Ciphers, ciphers, 4));
  NetSmb2CompressionCapabilities *Compression = Cmd->NegotiateContexts[2].data_as<NetSmb2CompressionCapabilities>();
  TESTCHECK(Compression && Compression->Flags() == SMB2_COMPRESSION_CAPABILITIES_FLAG_CHAINED && Compression->CompressionAlgorithms.size() == 5);
  static const word signers[] = { 2, 1, 0 };
  NetSmb2SigningCapabilities *Signing = Cmd->NegotiateContexts[3].data_as<NetSmb2SigningCapabilities>();
  TESTCHECK(Signing && words_match(Signing->SigningAlgorithms, signers, 3));
  NetSmb2NetnameNegotiateContextId *Netname = Cmd->NegotiateContexts[4].data_as<NetSmb2NetnameNegotiateContextId>();
  TESTCHECK(Netname && Netname->NetName == "localhost");
  static const word transforms[] = { 1, 2 };
  NetSmb2RdmaTransformCapabilities *Rdma = Cmd->NegotiateContexts[5].data_as<NetSmb2RdmaTransformCapabilities>();
  TESTCHECK(Rdma && words_match(Rdma->RdmaTransformIds, transforms, 2));
}

static void test_negotiate_request_without_contexts(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing negotiate request without contexts *** " << endl;
  NetSmb2NegotiateCmd *Cmd = new NetSmb2NegotiateCmd();
  Cmd->SecurityMode = SMB2_NEGOTIATE_SIGNING_ENABLED;
  Cmd->add_dialect(SMB2_DIALECT_2002);
  Cmd->add_dialect(SMB2_DIALECT_2100);
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes("2400 0200 0100 0000 00000000 00000000000000000000000000000000 00000000 0000 0000 0202 1002"), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_NEGOTIATE, false, 0, body, msg));
  TESTCHECK(msg.body_as<NetSmb2NegotiateCmd>() && msg.body_as<NetSmb2NegotiateCmd>()->NegotiateContexts.size() == 0);

  // Contexts counted but no offset to find them at
  std::vector<byte> counted = body;
  counted[32] = 2;
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_NEGOTIATE, false, 0, counted, msg));
  std::vector<byte> unplaced = hex_to_bytes(negotiate_request_body);
  for (int i = 28; i < 32; i++)
    unplaced[i] = 0;
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_NEGOTIATE, false, 0, unplaced, msg));

  // A dialect count past the end of the message
  std::vector<byte> truncated = body;
  truncated[2] = 9;
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_NEGOTIATE, false, 0, truncated, msg));
}

static NetSmb2NegotiateReply *build_negotiate_reply(word dialect)
{
  NetSmb2NegotiateReply *Reply = new NetSmb2NegotiateReply();
  Reply->SecurityMode = SMB2_NEGOTIATE_SIGNING_ENABLED;
  Reply->DialectRevision = dialect;
  Reply->ServerGuid = &hex_to_bytes("b921f8e01507aa41be3867febf5e2e11")[0];
  Reply->Capabilities = 0x2f;
  Reply->MaxTransactSize = 0x800000;
  Reply->MaxReadSize = 0x800000;
  Reply->MaxWriteSize = 0x800000;
  Reply->SystemTime = 0x01db69c578d876a8ULL;
  Reply->SecurityBuffer = hex_to_bytes("602806062b0601050502a01e301ca01a3018060a2b06010401823702021e060a2b06010401823702020a");
  if (dialect != SMB2_DIALECT_3110)
    return Reply;

  NetSmb2PreauthIntegrityCapabilities *Preauth = new NetSmb2PreauthIntegrityCapabilities();
  Preauth->HashAlgorithms.push_back(NetWireword(SMB2_PREAUTH_INTEGRITY_SHA512));
  Preauth->Salt = hex_to_bytes("d5671b24a1e9ccc893f5555a3103435a852bc3cb1ad32dc51f92806ef3fb4dd4");
  Reply->NegotiateContexts.push_back(NetSmb2NegotiateContext(Preauth));

  NetSmb2EncryptionCapabilities *Encryption = new NetSmb2EncryptionCapabilities();
  Encryption->Ciphers.push_back(NetWireword(SMB2_ENCRYPTION_AES128_GCM));
  Reply->NegotiateContexts.push_back(NetSmb2NegotiateContext(Encryption));

  NetSmb2SigningCapabilities *Signing = new NetSmb2SigningCapabilities();
  Signing->SigningAlgorithms.push_back(NetWireword(SMB2_SIGNING_AES_GMAC));
  Reply->NegotiateContexts.push_back(NetSmb2NegotiateContext(Signing));

  NetSmb2RdmaTransformCapabilities *Rdma = new NetSmb2RdmaTransformCapabilities();
  Rdma->RdmaTransformIds.push_back(NetWireword(SMB2_RDMA_TRANSFORM_ENCRYPTION));
  Rdma->RdmaTransformIds.push_back(NetWireword(SMB2_RDMA_TRANSFORM_SIGNING));
  Reply->NegotiateContexts.push_back(NetSmb2NegotiateContext(Rdma));

  NetSmb2CompressionCapabilities *Compression = new NetSmb2CompressionCapabilities();
  Compression->Flags = SMB2_COMPRESSION_CAPABILITIES_FLAG_CHAINED;
  Compression->CompressionAlgorithms.push_back(NetWireword(SMB2_COMPRESSION_LZ77));
  Compression->CompressionAlgorithms.push_back(NetWireword(SMB2_COMPRESSION_PATTERN_V1));
  Reply->NegotiateContexts.push_back(NetSmb2NegotiateContext(Compression));
  return Reply;
}

static void test_negotiate_reply(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing negotiate reply *** " << endl;
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(build_negotiate_reply(SMB2_DIALECT_3110), true, 0, body));
  TESTBYTES(hex_to_bytes(negotiate_reply_body), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_NEGOTIATE, true, 0, hex_to_bytes(negotiate_reply_body), msg));
  NetSmb2NegotiateReply *Reply = msg.body_as<NetSmb2NegotiateReply>();
  TESTCHECK(Reply != 0);
  if (!Reply)
    return;
  TESTCHECK(Reply->DialectRevision() == SMB2_DIALECT_3110);
  TESTCHECK(Reply->SecurityBufferOffset() == 0x80);
  TESTCHECK(Reply->SecurityBuffer.size() == 42);
  TESTCHECK(Reply->NegotiateContextOffset() == 0xb0);
  TESTCHECK(Reply->NegotiateContexts.size() == 5);
  if (Reply->NegotiateContexts.size() == 5)
  {
    TESTCHECK(Reply->NegotiateContexts[2].ContextType() == SMB2_SIGNING_CAPABILITIES);
    NetSmb2CompressionCapabilities *Compression = Reply->NegotiateContexts[4].data_as<NetSmb2CompressionCapabilities>();
    TESTCHECK(Compression && Compression->CompressionAlgorithms.size() == 2);
  }
}

static void test_negotiate_reply_dialect_rule(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing negotiate reply dialect rule *** " << endl;
  {
    // 3.0.2 reply carrying contexts
    NetSmb2NegotiateReply *Reply = build_negotiate_reply(SMB2_DIALECT_3110);
    Reply->DialectRevision = SMB2_DIALECT_3002;
    std::vector<byte> body;
    TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
    NetSmb2PlainMessage msg;
    TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_NEGOTIATE, true, 0, body, msg));
  }
  {
    // 3.1.1 reply without contexts
    std::vector<byte> body;
    TESTSTATUS(NetStatusOk, encode_body(build_negotiate_reply(SMB2_DIALECT_3002), true, 0, body));
    NetSmb2PlainMessage msg;
    TESTSTATUS(NetStatusOk, decode_body(SMB2_NEGOTIATE, true, 0, body, msg));
    NetSmb2NegotiateReply *Reply = msg.body_as<NetSmb2NegotiateReply>();
    TESTCHECK(Reply && Reply->NegotiateContextOffset() == 0 && Reply->NegotiateContextCount() == 0);
    body[4] = 0x11;
    body[5] = 0x03;
    TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_NEGOTIATE, true, 0, body, msg));
  }
}

static const char *smb1_negotiate_bytes =
  "ff534d4272000000001853c8000000000000000000000000ffff010000000000002200024e54204c4d20302e3132"
  "0002534d4220322e3030320002534d4220322e3f3f3f00";

static void test_smb1_multi_protocol_negotiate(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing SMB1 multi-protocol negotiate *** " << endl;
  NetSmb1NegotiateCmd Cmd;
  Cmd.set_multi_protocol_defaults();
  std::vector<byte> out;
  TESTSTATUS(NetStatusOk, encode_record(Cmd, out));
  TESTBYTES(hex_to_bytes(smb1_negotiate_bytes), out);
  TESTCHECK(smb2wire_is_smb1_message(&out[0], (dword) out.size()));

  std::vector<byte> bytes = hex_to_bytes(smb1_negotiate_bytes);
  NetSmb1NegotiateCmd Decoded;
  TESTSTATUS(NetStatusOk, decode_record(Decoded, bytes));
  TESTCHECK(Decoded.ByteCount() == 0x22 && Decoded.Flags2() == 0xc853);
  TESTCHECK(Decoded.Dialects.size() == 3);
  TESTCHECK(Decoded.is_smb2_supported());
  TESTCHECK(Decoded.offers_dialect(SMB1_DIALECT_SMB2_WILD) && !Decoded.offers_dialect("SMB 3.000"));

  // Not an SMB2 message
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusStructuralViolation, smb2wire_decode_message(&bytes[0], (dword) bytes.size(), msg));

  // Last dialect name runs past ByteCount
  std::vector<byte> unterminated = bytes;
  unterminated[33] = 0x21;
  TESTSTATUS(NetStatusBoundsViolation, decode_record(Decoded, unterminated));

  std::vector<byte> bad_format = bytes;
  bad_format[35] = 0x03;
  TESTSTATUS(NetStatusStructuralViolation, decode_record(Decoded, bad_format));

  // Only SMB1 dialects on offer
  NetSmb1NegotiateCmd Legacy;
  Legacy.add_dialect(SMB1_DIALECT_NT_LM_012);
  TESTSTATUS(NetStatusOk, encode_record(Legacy, out));
  TESTCHECK(out.size() == 35 + 12 && out[33] == 12);
  TESTSTATUS(NetStatusOk, decode_record(Decoded, out));
  TESTCHECK(!Decoded.is_smb2_supported());
}

int run_negotiate_tests()
{
  NetWireTestSuite Suite("negotiate");
  test_negotiate_request(Suite);
  test_negotiate_request_without_contexts(Suite);
  test_negotiate_reply(Suite);
  test_negotiate_reply_dialect_rule(Suite);
  test_smb1_multi_protocol_negotiate(Suite);
  return Suite.finish();
}
