//
// unittests_create.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB2 CREATE request and reply with chained create contexts, and the
//  individual create context data layouts.
//

#include "unittests.hpp"

static const char *create_request_body =
  "390000000200000000000000000000000000000000000000810010000000000007000000"
  "010000002000020078000a008800000068000000680065006c006c006f00000000000000"
  "380000001000040000001800200000004448325100000000000000000000000000000000"
  "0000000020a379c6a0c0ef118b7b000c2980168218000000100004000000180000000000"
  "4d78416300000000000000001000040000001800000000005146696400000000";

static const char *create_reply_body =
  "59000000010000003c083896ae4bdb01c8554b706b58db01620ccdc1c84bdb01620ccdc1"
  "c84bdb01000000000000000000000000000000001000000000000000490100000c000000"
  "090000000c0000009800000058000000200000001000040000001800080000004d784163"
  "0000000000000000ff011f00000000001000040000001800200000005146696400000000"
  "2ae7010000000400d9cf17b00000000000000000000000000000000000000000";

// Server 2016 answers MxAc on IPC$ with STATUS_NOT_MAPPED
static const char *create_reply_server2016_body =
  "590000000100000000000000000000000000000000000000000000000000000000000000"
  "000000000010000000000000000000000000000080000000760073000100000001000000"
  "01000000010000009800000058000000200000001000040000001800080000004d784163"
  "00000000730000c000000000000000001000040000001800200000005146696400000000"
  "9052d7150487ffff909c58cb82e6ffff00000000000000000000000000000000";

static void test_create_request(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create request *** " << endl;
  NetSmb2CreateCmd *Cmd = new NetSmb2CreateCmd();
  Cmd->RequestedOplockLevel = SMB2_OPLOCK_LEVEL_NONE;
  Cmd->ImpersonationLevel = SMB2_ImpersonationLevel_Impersonation;
  Cmd->DesiredAccess = SMB2_FPP_ACCESS_MASK_SYNCHRONIZE|SMB2_FPP_ACCESS_MASK_FILE_READ_ATTRIBUTES|SMB2_FPP_ACCESS_MASK_FILE_READ_DATA;
  Cmd->ShareAccess = SMB2_FILE_SHARE_READ|SMB2_FILE_SHARE_WRITE|SMB2_FILE_SHARE_DELETE;
  Cmd->CreateDisposition = SMB2_FILE_OPEN;
  Cmd->CreateOptions = FILE_SYNCHRONOUS_IO_NONALERT|FILE_DISALLOW_EXCLUSIVE;
  Cmd->Name = "hello";
  NetSmb2DurableHandleRequestV2 *Durable = new NetSmb2DurableHandleRequestV2();
  Durable->CreateGuid = &hex_to_bytes("20a379c6a0c0ef118b7b000c29801682")[0];
  Cmd->CreateContexts.push_back(NetSmb2CreateRequestContext(Durable));
  Cmd->CreateContexts.push_back(NetSmb2CreateRequestContext(new NetSmb2QueryMaximalAccessRequest()));
  Cmd->CreateContexts.push_back(NetSmb2CreateRequestContext(new NetSmb2QueryOnDiskIdRequest()));

  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  TESTBYTES(hex_to_bytes(create_request_body), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CREATE, false, 0, hex_to_bytes(create_request_body), msg));
  NetSmb2CreateCmd *Decoded = msg.body_as<NetSmb2CreateCmd>();
  TESTCHECK(Decoded != 0);
  if (!Decoded)
    return;
  TESTCHECK(Decoded->Name == "hello");
  TESTCHECK(Decoded->NameOffset() == 0x78);
  TESTCHECK(Decoded->CreateContextsOffset() == 0x88);
  TESTCHECK(Decoded->CreateContextsLength() == 0x68);
  TESTCHECK(Decoded->DesiredAccess() == 0x00100081);
  TESTCHECK(Decoded->CreateContexts.size() == 3);
  if (Decoded->CreateContexts.size() != 3)
    return;
  TESTCHECK(Decoded->CreateContexts[0].name() == SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2);
  NetSmb2DurableHandleRequestV2 *DecodedDurable = Decoded->CreateContexts[0].data_as<NetSmb2DurableHandleRequestV2>();
  TESTCHECK(DecodedDurable != 0);
  if (DecodedDurable)
    TESTBYTES(hex_to_bytes("20a379c6a0c0ef118b7b000c29801682"), std::vector<byte>(DecodedDurable->CreateGuid(), DecodedDurable->CreateGuid() + 16));
  NetSmb2QueryMaximalAccessRequest *MaximalAccess = Decoded->CreateContexts[1].data_as<NetSmb2QueryMaximalAccessRequest>();
  TESTCHECK(MaximalAccess && !MaximalAccess->timestamp_present());
  TESTCHECK(Decoded->CreateContexts[2].data_as<NetSmb2QueryOnDiskIdRequest>() != 0);
  TESTCHECK(Decoded->CreateContexts[2].DataLength() == 0);
}

static void test_create_request_without_contexts(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create request without contexts *** " << endl;
  NetSmb2CreateCmd *Cmd = new NetSmb2CreateCmd();
  Cmd->Name = "a";
  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));
  // Name at 0x78, the empty context list still lands on the next 8 byte boundary
  TESTCHECK(body.size() == 64);
  TESTCHECK(body.size() == 64 && body[48] == 0x80 && body[52] == 0);
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CREATE, false, 0, body, msg));
  NetSmb2CreateCmd *Decoded = msg.body_as<NetSmb2CreateCmd>();
  TESTCHECK(Decoded && Decoded->CreateContexts.size() == 0 && Decoded->CreateContextsLength() == 0);

  // Odd name length
  std::vector<byte> odd = body;
  odd[46] = 1;
  TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_CREATE, false, 0, odd, msg));
}

static void test_create_reply(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create reply *** " << endl;
  NetSmb2CreateReply *Reply = new NetSmb2CreateReply();
  Reply->CreateAction = 1;
  Reply->CreationTime = 133783827154208828ULL;
  Reply->LastAccessTime = 133797832406291912ULL;
  Reply->LastWriteTime = 133783939554544738ULL;
  Reply->ChangeTime = 133783939554544738ULL;
  Reply->FileAttributes = 0x10;
  Reply->FileId.set_ids(0x0000000c00000149ULL, 0x0000000c00000009ULL);
  NetSmb2QueryMaximalAccessResponse *MaximalAccess = new NetSmb2QueryMaximalAccessResponse();
  MaximalAccess->MaximalAccess = 0x001f01ff;
  Reply->CreateContexts.push_back(NetSmb2CreateResponseContext(MaximalAccess));
  NetSmb2QueryOnDiskIdResponse *OnDiskId = new NetSmb2QueryOnDiskIdResponse();
  OnDiskId->DiskFileId = 0x400000001e72aULL;
  OnDiskId->VolumeId = 0xb017cfd9ULL;
  Reply->CreateContexts.push_back(NetSmb2CreateResponseContext(OnDiskId));

  std::vector<byte> body;
  TESTSTATUS(NetStatusOk, encode_body(Reply, true, 0, body));
  TESTBYTES(hex_to_bytes(create_reply_body), body);

  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CREATE, true, 0, hex_to_bytes(create_reply_body), msg));
  NetSmb2CreateReply *Decoded = msg.body_as<NetSmb2CreateReply>();
  TESTCHECK(Decoded != 0);
  if (!Decoded)
    return;
  TESTCHECK(Decoded->FileId.persistent_id() == 0x0000000c00000149ULL);
  TESTCHECK(Decoded->FileId.volatile_id() == 0x0000000c00000009ULL);
  TESTCHECK(Decoded->CreateContexts.size() == 2);
  if (Decoded->CreateContexts.size() == 2)
  {
    NetSmb2QueryMaximalAccessResponse *DecodedAccess = Decoded->CreateContexts[0].data_as<NetSmb2QueryMaximalAccessResponse>();
    TESTCHECK(DecodedAccess && DecodedAccess->QueryStatus() == 0 && DecodedAccess->MaximalAccess() == 0x001f01ff);
    NetSmb2QueryOnDiskIdResponse *DecodedId = Decoded->CreateContexts[1].data_as<NetSmb2QueryOnDiskIdResponse>();
    TESTCHECK(DecodedId && DecodedId->DiskFileId() == 0x400000001e72aULL && DecodedId->VolumeId() == 0xb017cfd9ULL);
  }

  // Context list offset that is not 8 byte aligned
  std::vector<byte> misaligned = hex_to_bytes(create_reply_body);
  misaligned[80] = 0x9c;
  TESTSTATUS(NetStatusAlignmentViolation, decode_body(SMB2_CREATE, true, 0, misaligned, msg));

  // Context list running past the message
  std::vector<byte> too_long = hex_to_bytes(create_reply_body);
  too_long[84] = 0x60;
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_CREATE, true, 0, too_long, msg));
}

static void test_create_reply_server2016(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create reply from Server 2016 *** " << endl;
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusOk, decode_body(SMB2_CREATE, true, 0, hex_to_bytes(create_reply_server2016_body), msg));
  NetSmb2CreateReply *Decoded = msg.body_as<NetSmb2CreateReply>();
  TESTCHECK(Decoded != 0);
  if (!Decoded)
    return;
  TESTCHECK(Decoded->AllocationSize() == 4096);
  TESTCHECK(Decoded->FileAttributes() == 0x80);
  TESTCHECK(Decoded->CreateContexts.size() == 2);
  if (Decoded->CreateContexts.size() == 2)
  {
    NetSmb2QueryMaximalAccessResponse *DecodedAccess = Decoded->CreateContexts[0].data_as<NetSmb2QueryMaximalAccessResponse>();
    TESTCHECK(DecodedAccess && DecodedAccess->QueryStatus() == 0xc0000073);
    NetSmb2QueryOnDiskIdResponse *DecodedId = Decoded->CreateContexts[1].data_as<NetSmb2QueryOnDiskIdResponse>();
    TESTCHECK(DecodedId && DecodedId->DiskFileId() == 0xffff870415d75290ULL && DecodedId->VolumeId() == 0xffffe682cb589c90ULL);
  }
}

static void test_create_context_data(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create context data *** " << endl;
  std::vector<byte> out;
  {
    NetSmb2DurableHandleRequest R;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("00000000000000000000000000000000"), out);
    TESTSTATUS(NetStatusStructuralViolation, decode_record(R, hex_to_bytes("00000000000000000000000000000001")));
  }
  {
    NetSmb2DurableHandleResponse R;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("0000000000000000"), out);
  }
  {
    NetSmb2QueryMaximalAccessRequest R;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTCHECK(out.empty());
    R.set_timestamp(0x01db6b510da18f04ULL);
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("048fa10d516bdb01"), out);
    NetSmb2QueryMaximalAccessRequest D;
    TESTSTATUS(NetStatusOk, decode_record(D, out));
    TESTCHECK(D.timestamp_present() && D.Timestamp() == 0x01db6b510da18f04ULL);
  }
  {
    NetSmb2QueryMaximalAccessResponse R;
    R.MaximalAccess = 0x001f01ff;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("00000000ff011f00"), out);
  }
  {
    NetSmb2QueryOnDiskIdResponse R;
    R.DiskFileId = 0x2ae7010000000400ULL;
    R.VolumeId = 0xd9cf17b000000000ULL;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("000400000001e72a 00000000b017cfd9 00000000000000000000000000000000"), out);
  }
  {
    const char *lease_v2 = "d88f9db64b184d7ca35940c8a53cd2b703000000040000000000000000000000a38e152ddb5549f79cd1095496a0662700000000";
    NetSmb2RequestLease R(true);
    R.LeaseKey = &hex_to_bytes("d88f9db64b184d7ca35940c8a53cd2b7")[0];
    R.LeaseState = SMB2_LEASE_READ_CACHING|SMB2_LEASE_HANDLE_CACHING;
    R.LeaseFlags = SMB2_LEASE_FLAG_PARENT_LEASE_KEY_SET;
    R.ParentLeaseKey = &hex_to_bytes("a38e152ddb5549f79cd1095496a06627")[0];
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes(lease_v2), out);

    NetSmb2RequestLease D;
    TESTSTATUS(NetStatusOk, decode_record(D, hex_to_bytes(lease_v2)));
    TESTCHECK(D.is_version2() && D.LeaseState() == 3 && D.LeaseFlags() == 4 && D.Epoch() == 0);

    NetSmb2RequestLease V1;
    V1.LeaseState = SMB2_LEASE_READ_CACHING;
    TESTSTATUS(NetStatusOk, encode_record(V1, out));
    TESTCHECK(out.size() == 32);
    TESTSTATUS(NetStatusOk, decode_record(D, out));
    TESTCHECK(!D.is_version2() && D.LeaseState() == SMB2_LEASE_READ_CACHING);
  }
  {
    NetSmb2AllocationSize R;
    R.AllocationSize = 0xebfef0d4c000ULL;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("00c0d4f0feeb0000"), out);
  }
  {
    NetSmb2DurableHandleRequestV2 R;
    R.CreateGuid = &hex_to_bytes("44e8085ac3454d2387c6596d2bc8bca5")[0];
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("0000000000000000000000000000000044e8085ac3454d2387c6596d2bc8bca5"), out);
  }
  {
    NetSmb2DurableHandleResponseV2 R;
    R.Timeout = 180000;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("20bf020000000000"), out);
  }
  {
    NetSmb2TimewarpToken R;
    R.Timestamp = 0x01db6b510da18f04ULL;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("048fa10d516bdb01"), out);
  }
  {
    const char *reconnect_v2 = "b300000008000000dd000000080000008c423ea2ac1b437e845191f9f2277a9500000000";
    NetSmb2DurableHandleReconnectV2 D;
    TESTSTATUS(NetStatusOk, decode_record(D, hex_to_bytes(reconnect_v2)));
    TESTCHECK(D.FileId.persistent_id() == 0x00000008000000b3ULL);
    TESTCHECK(D.FileId.volatile_id() == 0x00000008000000ddULL);
    TESTSTATUS(NetStatusOk, encode_record(D, out));
    TESTBYTES(hex_to_bytes(reconnect_v2), out);
  }
  {
    NetSmb2AppInstanceId R;
    R.AppInstanceId = &hex_to_bytes("000102030405060708090a0b0c0d0e0f")[0];
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("1400 0000 000102030405060708090a0b0c0d0e0f"), out);
    out[0] = 0x18;
    TESTSTATUS(NetStatusStructuralViolation, decode_record(R, out));
  }
}

static void test_create_context_names(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create context names *** " << endl;
  {
    // GUID named context, name is 16 bytes and the data starts at 32
    NetSmb2AppInstanceVersion *Version = new NetSmb2AppInstanceVersion();
    Version->AppInstanceVersionHigh = 1;
    Version->AppInstanceVersionLow = 2;
    NetSmb2CreateRequestContextList List;
    List.push_back(NetSmb2CreateRequestContext(Version));
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(List, out));
    TESTCHECK(out.size() == 32 + 24);
    TESTBYTES(hex_to_bytes("00000000 1000 1000 0000 2000 18000000"), std::vector<byte>(out.begin(), out.begin() + 16));

    NetSmb2CreateRequestContextList Decoded;
    TESTSTATUS(NetStatusOk, decode_record(Decoded, out));
    TESTCHECK(Decoded.size() == 1);
    if (Decoded.size() == 1)
    {
      TESTCHECK(Decoded[0].name() == netwire_key(SMB2_CREATE_APP_INSTANCE_VERSION, 16));
      NetSmb2AppInstanceVersion *DecodedVersion = Decoded[0].data_as<NetSmb2AppInstanceVersion>();
      TESTCHECK(DecodedVersion && DecodedVersion->AppInstanceVersionLow() == 2);
    }
  }
  {
    // SecD and unknown names keep their bytes
    NetWireOpaqueVariant *Security = new NetWireOpaqueVariant(netwire_key(SMB2_CREATE_SD_BUFFER));
    Security->Data = hex_to_bytes("0100048000000000");
    NetWireOpaqueVariant *Vendor = new NetWireOpaqueVariant(netwire_key("ZzZz"));
    Vendor->Data = hex_to_bytes("aabb");
    NetSmb2CreateRequestContextList List;
    List.push_back(NetSmb2CreateRequestContext(Security));
    List.push_back(NetSmb2CreateRequestContext(Vendor));
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(List, out));
    TESTCHECK(out.size() == 32 + 26);
    TESTCHECK(out.size() > 0 && out[0] == 32);

    NetSmb2CreateRequestContextList Decoded;
    TESTSTATUS(NetStatusOk, decode_record(Decoded, out));
    TESTCHECK(Decoded.size() == 2);
    if (Decoded.size() == 2)
    {
      TESTCHECK(Decoded[0].name() == "SecD");
      TESTCHECK(Decoded[1].name() == "ZzZz");
      NetWireOpaqueVariant *DecodedVendor = Decoded[1].data_as<NetWireOpaqueVariant>();
      TESTCHECK(DecodedVendor != 0);
      if (DecodedVendor)
        TESTBYTES(hex_to_bytes("aabb"), DecodedVendor->Data());
    }
  }
}

static void test_create_ea_buffer(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing create extended attributes *** " << endl;
  {
    NetSmb2CreateEaBuffer R;
    ms_FILE_FULL_EA_INFORMATION Ea;
    Ea.set_name("name");
    Ea.EaValue = hex_to_bytes("616263");
    R.Entries.push_back(Ea);
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("00000000 00 04 0300 6e616d65 00 616263"), out);
  }
  {
    NetSmb2CreateCmd *Cmd = new NetSmb2CreateCmd();
    Cmd->Name = "file.txt";
    NetSmb2CreateEaBuffer *Attributes = new NetSmb2CreateEaBuffer();
    ms_FILE_FULL_EA_INFORMATION First;
    First.set_name("user.one");
    First.EaValue = hex_to_bytes("01");
    ms_FILE_FULL_EA_INFORMATION Second;
    Second.Flags = FILE_NEED_EA;
    Second.set_name("user.second");
    Second.EaValue = hex_to_bytes("0203040506");
    Attributes->Entries.push_back(First);
    Attributes->Entries.push_back(Second);
    Cmd->CreateContexts.push_back(NetSmb2CreateRequestContext(Attributes));
    std::vector<byte> body;
    TESTSTATUS(NetStatusOk, encode_body(Cmd, false, 0, body));

    NetSmb2PlainMessage msg;
    TESTSTATUS(NetStatusOk, decode_body(SMB2_CREATE, false, 0, body, msg));
    NetSmb2CreateCmd *Decoded = msg.body_as<NetSmb2CreateCmd>();
    TESTCHECK(Decoded && Decoded->CreateContexts.size() == 1);
    if (!Decoded || Decoded->CreateContexts.size() != 1)
      return;
    NetSmb2CreateEaBuffer *DecodedAttributes = Decoded->CreateContexts[0].data_as<NetSmb2CreateEaBuffer>();
    TESTCHECK(DecodedAttributes && DecodedAttributes->Entries.size() == 2);
    if (DecodedAttributes && DecodedAttributes->Entries.size() == 2)
    {
      TESTCHECK(DecodedAttributes->Entries[0].name() == "user.one");
      TESTCHECK(DecodedAttributes->Entries[1].name() == "user.second");
      TESTCHECK(DecodedAttributes->Entries[1].Flags() == FILE_NEED_EA);
      TESTBYTES(hex_to_bytes("0203040506"), DecodedAttributes->Entries[1].EaValue());
    }
  }
}

int run_create_tests()
{
  NetWireTestSuite Suite("create");
  test_create_request(Suite);
  test_create_request_without_contexts(Suite);
  test_create_reply(Suite);
  test_create_reply_server2016(Suite);
  test_create_context_data(Suite);
  test_create_context_names(Suite);
  test_create_ea_buffer(Suite);
  return Suite.finish();
}
