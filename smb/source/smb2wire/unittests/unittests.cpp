//
// unittests.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Test driver. smb2wire_unittests [suite|all] [-v]
//

#include <cstdio>
#include "unittests.hpp"

NetWireTestSuite::NetWireTestSuite(const char *_suite_name)
{
  suite_name = _suite_name;
  passed = 0;
  failed = 0;
  cout_log(LL_TESTS)  << "*** Testing " << suite_name << " *** " << endl;
}

void NetWireTestSuite::check(bool condition, const char *expression, const char *file, int line)
{
  if (condition)
  {
    passed++;
    return;
  }
  failed++;
  cout_log(LL_TESTS)  << "FAILED " << file << ":" << line << " " << expression << endl;
}

void NetWireTestSuite::check_status(NetStatus expected, NetStatus found, const char *expression, const char *file, int line)
{
  if (expected == found)
  {
    passed++;
    return;
  }
  failed++;
  cout_log(LL_TESTS)  << "FAILED " << file << ":" << line << " " << expression
                      << " expected " << smb2wire_status_string(expected) << " got " << smb2wire_status_string(found) << endl;
}

void NetWireTestSuite::check_bytes(const std::vector<byte> &expected, const std::vector<byte> &found, const char *expression, const char *file, int line)
{
  if (expected == found)
  {
    passed++;
    return;
  }
  failed++;
  cout_log(LL_TESTS)  << "FAILED " << file << ":" << line << " " << expression << endl;
  cout_log(LL_TESTS)  << "  expected " << bytes_to_hex(expected) << endl;
  cout_log(LL_TESTS)  << "  got      " << bytes_to_hex(found) << endl;
}

int NetWireTestSuite::finish()
{
  cout_log(LL_TESTS)  << "*** " << suite_name << ": " << passed << " passed, " << failed << " failed *** " << endl;
  return failed;
}

static int hex_digit(char c)
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Whitespace and other separators are skipped
std::vector<byte> hex_to_bytes(const char *hex)
{
  std::vector<byte> r;
  int high = -1;
  for (const char *p = hex; *p; p++)
  {
    int d = hex_digit(*p);
    if (d < 0)
      continue;
    if (high < 0)
      high = d;
    else
    {
      r.push_back((byte)((high << 4) | d));
      high = -1;
    }
  }
  return r;
}

std::string bytes_to_hex(const std::vector<byte> &bytes)
{
  std::string r;
  char hex[4];
  for (size_t i = 0; i < bytes.size(); i++)
  {
    snprintf(hex, sizeof(hex), "%02x", bytes[i]);
    r += hex;
  }
  return r;
}

static void initialize_test_header(NetSmb2Header &Header, word command, bool response, dword status)
{
  Header.Initialize(command, 1, 0x0000100000000011ULL);
  if (response)
    Header.Flags = SMB2_FLAGS_SERVER_TO_REDIR;
  Header.Status_ChannelSequenceReserved = status;
}

NetStatus encode_body(NetWireVariant *body, bool response, dword status, std::vector<byte> &body_bytes)
{
  NetSmb2PlainMessage msg;
  NetSmb2Command *command = dynamic_cast<NetSmb2Command *>(body);
  initialize_test_header(msg.Header, command ? command->command_id() : 0, response, status);
  msg.set_body(body);
  std::vector<byte> out;
  PROPAGATE_NETSTATUS(smb2wire_encode_message(msg, out));
  ASSURE(out.size() >= 64, NetStatusFailed);
  body_bytes.assign(out.begin() + 64, out.end());
  return NetStatusOk;
}

NetStatus decode_body(word command, bool response, dword status, const std::vector<byte> &body_bytes, NetSmb2PlainMessage &msg)
{
  NetSmb2Header Header;
  initialize_test_header(Header, command, response, status);
  NetStreamOutputBuffer StreamBuffer;
  PROPAGATE_NETSTATUS(Header.encode(StreamBuffer));
  if (!body_bytes.empty())
    PROPAGATE_NETSTATUS(StreamBuffer.push_to_buffer(&body_bytes[0], (dword) body_bytes.size()));
  std::vector<byte> message = StreamBuffer.contents();
  return smb2wire_decode_message(&message[0], (dword) message.size(), msg);
}

NetStatus encode_record(NetWireRecord &record, std::vector<byte> &out)
{
  NetStreamOutputBuffer StreamBuffer;
  PROPAGATE_NETSTATUS(record.encode(StreamBuffer));
  out = StreamBuffer.contents();
  return NetStatusOk;
}

NetStatus decode_record(NetWireRecord &record, const std::vector<byte> &bytes)
{
  NetStreamInputBuffer StreamBuffer(bytes.empty() ? 0 : &bytes[0], (dword) bytes.size());
  return record.decode(StreamBuffer);
}

struct TestSuiteEntry {
  const char *name;
  int (*run)();
};

static const TestSuiteEntry test_suites[] = {
  { "core",           run_core_tests },
  { "negotiate",      run_negotiate_tests },
  { "session",        run_session_tests },
  { "create",         run_create_tests },
  { "fileio",         run_fileio_tests },
  { "ioctl",          run_ioctl_tests },
  { "notify",         run_notify_tests },
  { "setinfo",        run_setinfo_tests },
  { "querydirectory", run_querydirectory_tests },
  { "error",          run_error_tests },
};

int main(int argc, char **argv)
{
  const char *selected = "all";
  for (int i = 1; i < argc; i++)
  {
    if (strcmp(argv[i], "-v") == 0)
      smb2wire_set_diag_level(DIAG_DEBUG);
    else
      selected = argv[i];
  }
  int failures = 0;
  bool found = false;
  for (size_t i = 0; i < sizeof(test_suites)/sizeof(test_suites[0]); i++)
  {
    if (strcmp(selected, "all") == 0 || strcmp(selected, test_suites[i].name) == 0)
    {
      found = true;
      failures += test_suites[i].run();
    }
  }
  if (!found)
  {
    cout_log(LL_TESTS)  << "unknown suite " << selected << endl;
    return 2;
  }
  cout_log(LL_TESTS)  << (failures ? "*** FAILURES *** " : "*** ALL PASSED *** ") << failures << endl;
  return failures ? 1 : 0;
}
