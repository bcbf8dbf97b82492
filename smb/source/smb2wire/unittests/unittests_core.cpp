//
// unittests_core.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Field table, marker, list, string and tagged record tests that do not
//  depend on a particular SMB2 command.
//

#include "unittests.hpp"

// Tag, offset and length followed by an 8 byte aligned blob
class TestOffsetRecord : public NetWireStruct {
public:
  TestOffsetRecord() {objectsize=6; }
  NetWireword     Tag;
  NetWireMarker16 DataOffset;
  NetWireMarker16 DataLength;
  NetWireblob     Data;
  const char *command_name() { return "TestOffsetRecord";}
protected:
  void BindFields(NetWireFieldTable &T)
  {
    BINDFIELD(Tag);
    BINDMARKER(DataOffset);
    BINDMARKER(DataLength);
    BINDPAYLOAD(Data).aligned(8).at_offset(DataOffset).sized_by(DataLength);
  }
};

// Offset counted from the start of the record instead of the stream
class TestRelativeRecord : public NetWireStruct {
public:
  TestRelativeRecord() {objectsize=4; }
  NetWireMarker16 DataOffset;
  NetWireMarker16 DataLength;
  NetWireblob     Data;
  const char *command_name() { return "TestRelativeRecord";}
protected:
  void BindFields(NetWireFieldTable &T)
  {
    BINDMARKER(DataOffset);
    BINDMARKER(DataLength);
    BINDPAYLOAD(Data).at_offset(DataOffset, NetWireAnchor::record_start()).sized_by(DataLength);
  }
};

class TestShortLengthRecord : public NetWireStruct {
public:
  TestShortLengthRecord() {objectsize=1; }
  NetWireMarker8 DataLength;
  NetWireblob    Data;
  const char *command_name() { return "TestShortLengthRecord";}
protected:
  void BindFields(NetWireFieldTable &T)
  {
    BINDMARKER(DataLength);
    BINDPAYLOAD(Data).sized_by(DataLength);
  }
};

// Offset field with nothing that ever points it anywhere
class TestDanglingRecord : public NetWireStruct {
public:
  TestDanglingRecord() {objectsize=4; }
  NetWireMarker16 DataOffset;
  NetWireword     Value;
  const char *command_name() { return "TestDanglingRecord";}
protected:
  void BindFields(NetWireFieldTable &T)
  {
    BINDMARKER(DataOffset);
    BINDFIELD(Value);
  }
};

static void test_markers(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing position markers *** " << endl;
  {
    TestOffsetRecord R;
    R.Tag = 0xaabb;
    R.Data = hex_to_bytes("010203");
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("bbaa0800 0300 0000 010203"), out);

    TestOffsetRecord D;
    TESTSTATUS(NetStatusOk, decode_record(D, out));
    TESTCHECK(D.Tag() == 0xaabb);
    TESTCHECK(D.DataOffset() == 8);
    TESTCHECK(D.DataLength() == 3);
    TESTBYTES(hex_to_bytes("010203"), D.Data());
  }
  {
    // Prefix bytes ahead of the record must not count toward its offsets
    NetStreamOutputBuffer StreamBuffer;
    byte prefix[2] = {0xff, 0xff};
    TESTSTATUS(NetStatusOk, StreamBuffer.push_to_buffer(prefix, 2));
    TestRelativeRecord R;
    R.Data = hex_to_bytes("4142");
    TESTSTATUS(NetStatusOk, R.encode(StreamBuffer));
    std::vector<byte> out = StreamBuffer.contents();
    TESTBYTES(hex_to_bytes("ffff 0400 0200 4142"), out);

    NetStreamInputBuffer InputBuffer(&out[0], (dword) out.size());
    TESTSTATUS(NetStatusOk, InputBuffer.skip_input(2));
    TestRelativeRecord D;
    TESTSTATUS(NetStatusOk, D.decode(InputBuffer));
    TESTBYTES(hex_to_bytes("4142"), D.Data());
  }
  {
    TestShortLengthRecord R;
    R.Data = std::vector<byte>(300, 0x55);
    std::vector<byte> out;
    TESTSTATUS(NetStatusEncodingOverflow, encode_record(R, out));
  }
  {
    TestDanglingRecord R;
    R.Value = 7;
    std::vector<byte> out;
    TESTSTATUS(NetStatusUnresolvedMarker, encode_record(R, out));
  }
  {
    NetStreamOutputBuffer StreamBuffer;
    NetWireMarker16 Marker;
    TESTSTATUS(NetStatusOk, Marker.write_placeholder(StreamBuffer));
    TESTSTATUS(NetStatusEncodingOverflow, Marker.resolve(StreamBuffer, 0x10000));
    TESTCHECK(!Marker.resolved());
    TESTSTATUS(NetStatusOk, Marker.resolve(StreamBuffer, 0xffff));
    TESTBYTES(hex_to_bytes("ffff"), StreamBuffer.contents());
  }
}

static void test_bounds(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing bounds *** " << endl;
  {
    TestOffsetRecord D;
    TESTSTATUS(NetStatusBoundsViolation, decode_record(D, hex_to_bytes("bbaa 2000 0300 0000 010203")));
  }
  {
    TestOffsetRecord D;
    TESTSTATUS(NetStatusBoundsViolation, decode_record(D, hex_to_bytes("bbaa 0800 0900 0000 010203")));
  }
  {
    TestOffsetRecord D;
    TESTSTATUS(NetStatusBoundsViolation, decode_record(D, hex_to_bytes("bbaa08")));
  }
  {
    // Cipher count of 3 inside a 4 byte context, the trailing bytes belong to the next context
    NetSmb2NegotiateContext D;
    TESTSTATUS(NetStatusBoundsViolation, decode_record(D, hex_to_bytes("0200 0400 00000000 0300 0200 0100 0400 0300")));
  }
  {
    std::vector<byte> bytes = hex_to_bytes("00112233445566778899");
    NetStreamInputBuffer InputBuffer(&bytes[0], (dword) bytes.size());
    TESTSTATUS(NetStatusOk, InputBuffer.skip_input(2));
    {
      NetStreamBoundedRegion Region(InputBuffer);
      TESTSTATUS(NetStatusOk, Region.open(4));
      TESTCHECK(InputBuffer.bytes_remaining() == 4);
      TESTSTATUS(NetStatusBoundsViolation, InputBuffer.seek_to(7));
      TESTSTATUS(NetStatusBoundsViolation, InputBuffer.seek_to(1));
      byte b[5];
      TESTSTATUS(NetStatusBoundsViolation, InputBuffer.pull_input(b, 5));
      TESTSTATUS(NetStatusOk, InputBuffer.pull_input(b, 1));
      TESTCHECK(b[0] == 0x22);
    }
    // Closing the region leaves the cursor at its end
    TESTCHECK(InputBuffer.stream_position() == 6);
    TESTCHECK(InputBuffer.bytes_remaining() == 4);
    NetStreamBoundedRegion TooLong(InputBuffer);
    TESTSTATUS(NetStatusBoundsViolation, TooLong.open(5));
  }
  {
    NetWireArray<NetWireword> Array;
    TESTSTATUS(NetStatusBoundsViolation, Array.expect_elements(70000));
    TESTSTATUS(NetStatusOk, Array.expect_elements(3));
  }
  {
    byte small[8];
    NetStreamOutputBuffer StreamBuffer;
    StreamBuffer.attach_buffer(small, sizeof(small));
    TESTSTATUS(NetStatusOk, StreamBuffer.push_zeros(6));
    TESTSTATUS(NetStatusFull, StreamBuffer.push_zeros(4));
    TESTSTATUS(NetStatusBoundsViolation, StreamBuffer.seek_to(7));
    TESTSTATUS(NetStatusOk, StreamBuffer.pad_to(8));
    TESTCHECK(StreamBuffer.buffered_count() == 8);
  }
}

static void test_tagged(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing tagged records *** " << endl;
  {
    // Unregistered context type keeps its bytes
    NetWireOpaqueVariant *Unknown = new NetWireOpaqueVariant(netwire_key((word)0x0099));
    Unknown->Data = hex_to_bytes("aabbcc");
    NetSmb2NegotiateContext R;
    R.Data.assign(Unknown);
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTBYTES(hex_to_bytes("9900 0300 00000000 aabbcc"), out);

    NetSmb2NegotiateContext D;
    std::vector<byte> in = out;
    in.push_back(0xee);
    NetStreamInputBuffer InputBuffer(&in[0], (dword) in.size());
    TESTSTATUS(NetStatusOk, D.decode(InputBuffer));
    TESTCHECK(D.ContextType() == 0x0099);
    TESTCHECK(D.data_as<NetWireOpaqueVariant>() != 0);
    if (D.data_as<NetWireOpaqueVariant>())
      TESTBYTES(hex_to_bytes("aabbcc"), D.data_as<NetWireOpaqueVariant>()->Data());
    TESTCHECK(InputBuffer.stream_position() == 11);
  }
  {
    // A three byte discriminant can not be carried in a u16 ContextType
    NetWireOpaqueVariant *Unknown = new NetWireOpaqueVariant(netwire_key((const byte *)"\x01\x02\x03", 3));
    NetSmb2NegotiateContext R;
    R.Data.assign(Unknown);
    std::vector<byte> out;
    TESTSTATUS(NetStatusEncodingOverflow, encode_record(R, out));
  }
  {
    NetSmb2NegotiateContext R;
    std::vector<byte> out;
    TESTSTATUS(NetStatusBadCallParms, encode_record(R, out));
  }
  {
    NetSmb2SvhdxOpenDevice R;
    NetSvhdxOpenDeviceContextV1 *Device = new NetSvhdxOpenDeviceContextV1();
    Device->HasInitiatorId = 1;
    Device->OpenRequestId = 0x1234;
    R.Device.assign(Device);
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(R, out));
    TESTCHECK(out.size() == 168);
    TESTCHECK(out.size() > 4 && out[0] == 1 && out[4] == 1);

    NetSmb2SvhdxOpenDevice D;
    TESTSTATUS(NetStatusOk, decode_record(D, out));
    TESTCHECK(D.Device.variant_as<NetSvhdxOpenDeviceContextV1>() != 0);
    TESTCHECK(D.Device.variant_as<NetSvhdxOpenDeviceContextV2>() == 0);
    if (D.Device.variant_as<NetSvhdxOpenDeviceContextV1>())
      TESTCHECK(D.Device.variant_as<NetSvhdxOpenDeviceContextV1>()->OpenRequestId() == 0x1234);

    std::vector<byte> v2(192, 0);
    v2[0] = 2;
    NetSmb2SvhdxOpenDevice D2;
    TESTSTATUS(NetStatusOk, decode_record(D2, v2));
    TESTCHECK(D2.Device.variant_as<NetSvhdxOpenDeviceContextV2>() != 0);

    std::vector<byte> v3(168, 0);
    v3[0] = 3;
    NetSmb2SvhdxOpenDevice D3;
    TESTSTATUS(NetStatusUnknownDiscriminant, decode_record(D3, v3));
  }
  {
    // Copies own their variant
    NetSmb2NegotiateContext A(new NetSmb2TransportCapabilities());
    NetSmb2NegotiateContext B(A);
    TESTCHECK(A.Data() != B.Data());
    TESTCHECK(B.data_as<NetSmb2TransportCapabilities>() != 0);
    NetSmb2NegotiateContext C;
    C = B;
    TESTCHECK(C.data_as<NetSmb2TransportCapabilities>() != 0 && C.Data() != B.Data());
  }
  {
    TESTCHECK(netwire_key_text(netwire_key((word)0x0102)) == "0201");
    TESTCHECK(netwire_key(SMB2_CREATE_QUERY_ON_DISK_ID) == "QFid");
  }
}

class TestEightByteItem : public NetWireStruct {
public:
  TestEightByteItem() {objectsize=8; }
  TestEightByteItem(ddword v) {objectsize=8; Value = v; }
  NetWireddword Value;
  const char *command_name() { return "TestEightByteItem";}
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(Value); }
};

static void test_lists(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing chained lists *** " << endl;
  const char *two_entries = "20000000 04000000 14000000 4e0065007700200066006f006c00640065007200"
                            "00000000 05000000 08000000 6a00640073006100";
  {
    ms_FILE_NOTIFY_LIST List;
    List.push_back(ms_FILE_NOTIFY_INFORMATION(FILE_ACTION_RENAMED_OLD_NAME, "New folder"));
    List.push_back(ms_FILE_NOTIFY_INFORMATION(FILE_ACTION_RENAMED_NEW_NAME, "jdsa"));
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(List, out));
    TESTBYTES(hex_to_bytes(two_entries), out);
  }
  {
    ms_FILE_NOTIFY_LIST List;
    TESTSTATUS(NetStatusOk, decode_record(List, hex_to_bytes(two_entries)));
    TESTCHECK(List.size() == 2);
    if (List.size() == 2)
    {
      TESTCHECK(List[0].Action() == FILE_ACTION_RENAMED_OLD_NAME);
      TESTCHECK(List[0].FileName == "New folder");
      TESTCHECK(List[1].FileName == "jdsa");
    }
  }
  {
    std::vector<byte> trailing = hex_to_bytes(two_entries);
    trailing.resize(trailing.size() + 4, 0);
    ms_FILE_NOTIFY_LIST Strict;
    TESTSTATUS(NetStatusStructuralViolation, decode_record(Strict, trailing));
    ms_FILE_NOTIFY_LIST Lenient;
    Lenient.set_strict_termination(false);
    TESTSTATUS(NetStatusOk, decode_record(Lenient, trailing));
    TESTCHECK(Lenient.size() == 2);
  }
  {
    std::vector<byte> misaligned = hex_to_bytes(two_entries);
    misaligned[0] = 0x21;
    ms_FILE_NOTIFY_LIST List;
    TESTSTATUS(NetStatusAlignmentViolation, decode_record(List, misaligned));
  }
  {
    std::vector<byte> past_end = hex_to_bytes(two_entries);
    past_end[0] = 0x40;
    ms_FILE_NOTIFY_LIST List;
    TESTSTATUS(NetStatusBoundsViolation, decode_record(List, past_end));
  }
  {
    // Zero NextEntryOffset on an entry that is not the last one
    std::vector<byte> early_end = hex_to_bytes(two_entries);
    early_end[0] = 0;
    ms_FILE_NOTIFY_LIST List;
    TESTSTATUS(NetStatusStructuralViolation, decode_record(List, early_end));
  }
  {
    NetWireChainedList<TestEightByteItem, 4> List;
    List.push_back(TestEightByteItem(0x1111111111111111ULL));
    List.push_back(TestEightByteItem(0x2222222222222222ULL));
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(List, out));
    TESTBYTES(hex_to_bytes("0c000000 1111111111111111 00000000 2222222222222222"), out);
    NetWireChainedList<TestEightByteItem, 4> Decoded;
    TESTSTATUS(NetStatusOk, decode_record(Decoded, out));
    TESTCHECK(Decoded.size() == 2);
    if (Decoded.size() == 2)
      TESTCHECK(Decoded[0].Value() == 0x1111111111111111ULL && Decoded[1].Value() == 0x2222222222222222ULL);
  }
  {
    ms_FILE_NOTIFY_LIST List;
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(List, out));
    TESTCHECK(out.empty());
    TESTSTATUS(NetStatusOk, decode_record(List, out));
    TESTCHECK(List.size() == 0);
  }
}

static void test_strings(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing sized strings *** " << endl;
  {
    NetWireSizedString S("hello");
    TESTCHECK(S.byte_length() == 10);
    TESTCHECK(S.utf16_length() == 5);
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(S, out));
    TESTBYTES(hex_to_bytes("680065006c006c006f00"), out);
  }
  {
    std::vector<byte> bytes = hex_to_bytes("680065006c00");
    NetStreamInputBuffer InputBuffer(&bytes[0], (dword) bytes.size());
    NetWireSizedString S;
    TESTSTATUS(NetStatusStructuralViolation, S.decode(InputBuffer, 3));
    NetStreamInputBuffer Again(&bytes[0], (dword) bytes.size());
    TESTSTATUS(NetStatusOk, S.decode(Again, 4));
    TESTCHECK(S.ascii() == "he");
    TESTCHECK(Again.bytes_remaining() == 2);
  }
  {
    std::vector<byte> bytes = hex_to_bytes("680065006c006c006f00");
    NetStreamInputBuffer InputBuffer(&bytes[0], (dword) bytes.size());
    NetWireSizedString S;
    TESTSTATUS(NetStatusOk, S.decode(InputBuffer, 10));
    TESTCHECK(S.utf16_length() == 5 && S == "hello");
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(S, out));
    TESTBYTES(bytes, out);
    TESTCHECK(S.byte_length() == 10);
  }
  {
    NetWireSizedString S;
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, encode_record(S, out));
    TESTCHECK(out.empty());
  }
}

static void test_header(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing header *** " << endl;
  NetSmb2Header Request;
  Request.Initialize(SMB2_CHANGE_NOTIFY, 9, 0x11223344);
  NetSmb2Header Header;
  Header.InitializeReply(Request, SMB2_STATUS_PENDING);
  Header.set_async_id(0x0102030405060708ULL);
  std::vector<byte> out;
  TESTSTATUS(NetStatusOk, encode_record(Header, out));
  TESTCHECK(out.size() == 64);
  TESTBYTES(hex_to_bytes("fe534d42 4000"), std::vector<byte>(out.begin(), out.begin() + 6));

  NetSmb2Header D;
  TESTSTATUS(NetStatusOk, decode_record(D, out));
  TESTCHECK(D.is_response());
  TESTCHECK(D.is_async());
  TESTCHECK(D.async_id() == 0x0102030405060708ULL);
  TESTCHECK(D.Command() == SMB2_CHANGE_NOTIFY);
  TESTCHECK(D.MessageId() == 9);
  TESTCHECK(D.Status_ChannelSequenceReserved() == SMB2_STATUS_PENDING);

  std::vector<byte> bad_protocol = out;
  bad_protocol[0] = 0xff;
  TESTSTATUS(NetStatusStructuralViolation, decode_record(D, bad_protocol));

  std::vector<byte> bad_size = out;
  bad_size[4] = 0x41;
  TESTSTATUS(NetStatusStructuralViolation, decode_record(D, bad_size));

  std::vector<byte> short_header(out.begin(), out.begin() + 40);
  TESTSTATUS(NetStatusBoundsViolation, decode_record(D, short_header));
}

static void test_message_framing(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing message framing *** " << endl;
  {
    NetSmb2PlainMessage msg;
    msg.Header.Initialize(SMB2_ECHO, 1, 0);
    std::vector<byte> out;
    TESTSTATUS(NetStatusBadCallParms, smb2wire_encode_message(msg, out));
  }
  {
    NetSmb2PlainMessage msg;
    msg.Header.Initialize(0, 1, 0);
    msg.set_body(new NetSmb2EchoCmd());
    std::vector<byte> out;
    TESTSTATUS(NetStatusOk, smb2wire_encode_message(msg, out));
    TESTCHECK(out.size() == 68);
    TESTCHECK(msg.Header.Command() == SMB2_ECHO);

    byte fixed[80];
    dword used = 0;
    TESTSTATUS(NetStatusOk, smb2wire_encode_message(msg, fixed, sizeof(fixed), used));
    TESTCHECK(used == 68);
    TESTBYTES(out, std::vector<byte>(fixed, fixed + used));
    TESTSTATUS(NetStatusFull, smb2wire_encode_message(msg, fixed, 66, used));
    TESTCHECK(used == 0);
  }
  {
    // Error bodies only on failed responses
    NetSmb2PlainMessage msg;
    msg.Header.Initialize(SMB2_CREATE, 1, 0);
    msg.Header.Flags = SMB2_FLAGS_SERVER_TO_REDIR;
    msg.set_body(new NetSmb2ErrorReply());
    std::vector<byte> out;
    TESTSTATUS(NetStatusBadCallParms, smb2wire_encode_message(msg, out));
    msg.Header.Status_ChannelSequenceReserved = SMB2_STATUS_ACCESS_DENIED;
    TESTSTATUS(NetStatusOk, smb2wire_encode_message(msg, out));
    msg.set_body(new NetSmb2CreateReply());
    TESTSTATUS(NetStatusBadCallParms, smb2wire_encode_message(msg, out));
  }
  {
    NetSmb2PlainMessage msg;
    TESTSTATUS(NetStatusOk, decode_body(0x0099, false, 0, hex_to_bytes("01020304"), msg));
    TESTCHECK(msg.body_as<NetWireOpaqueVariant>() != 0);
    if (msg.body_as<NetWireOpaqueVariant>())
      TESTBYTES(hex_to_bytes("01020304"), msg.body_as<NetWireOpaqueVariant>()->Data());
  }
  {
    NetSmb2PlainMessage msg;
    TESTSTATUS(NetStatusStructuralViolation, decode_body(SMB2_ECHO, false, 0, hex_to_bytes("05000000"), msg));
    TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_ECHO, false, 0, hex_to_bytes("0400"), msg));
  }
}

static void test_diagnostic_dumps(NetWireTestSuite &Suite)
{
  cout_log(LL_TESTS)  << "*** Testing diagnostic dumps *** " << endl;
  smb_diaglevel saved_level = smb2wire_get_diag_level();
  smb2wire_set_diag_level(DIAG_DEBUG);
  std::vector<byte> bytes = hex_to_bytes("000102030405060708090a0b0c0d0e0f101112");
  diag_dump_bin_fn(DIAG_DEBUG, "dump", &bytes[0], (int) bytes.size());
  diag_dump_unicode_fn(DIAG_DEBUG, "unicode", &bytes[0], (int) bytes.size() - 1);
  // Failed decodes dump the message they were given
  NetSmb2PlainMessage msg;
  TESTSTATUS(NetStatusBoundsViolation, decode_body(SMB2_ECHO, false, 0, hex_to_bytes("0400"), msg));
  smb2wire_set_diag_level(saved_level);
  TESTCHECK(smb2wire_get_diag_level() == saved_level);
}

int run_core_tests()
{
  NetWireTestSuite Suite("core");
  test_markers(Suite);
  test_bounds(Suite);
  test_tagged(Suite);
  test_lists(Suite);
  test_strings(Suite);
  test_header(Suite);
  test_message_framing(Suite);
  test_diagnostic_dumps(Suite);
  return Suite.finish();
}
