//
// unittests.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Shared helpers for the wire codec test suites. Hex vectors are bodies
//  captured behind a 64 byte header, so absolute offsets inside them count
//  the header.
//
#ifndef include_unittests
#define include_unittests

#include "smb2message.hpp"

class NetWireTestSuite {
public:
  NetWireTestSuite(const char *_suite_name);
  void check(bool condition, const char *expression, const char *file, int line);
  void check_status(NetStatus expected, NetStatus found, const char *expression, const char *file, int line);
  void check_bytes(const std::vector<byte> &expected, const std::vector<byte> &found, const char *expression, const char *file, int line);
  /// Prints the tally, returns the failure count
  int finish();
private:
  const char *suite_name;
  int passed;
  int failed;
};

#define TESTCHECK(C)      Suite.check((C), #C, __FILE__, __LINE__)
#define TESTSTATUS(E, X)  Suite.check_status((E), (X), #X, __FILE__, __LINE__)
#define TESTBYTES(E, F)   Suite.check_bytes((E), (F), #F, __FILE__, __LINE__)

std::vector<byte> hex_to_bytes(const char *hex);
std::string bytes_to_hex(const std::vector<byte> &bytes);

/// Encodes body behind a header for command/status and returns what follows the header. Takes ownership of body.
NetStatus encode_body(NetWireVariant *body, bool response, dword status, std::vector<byte> &body_bytes);
/// Prefixes a header and decodes the whole message
NetStatus decode_body(word command, bool response, dword status, const std::vector<byte> &body_bytes, NetSmb2PlainMessage &msg);

/// Stand alone record encode/decode, used for contexts and fscc records
NetStatus encode_record(NetWireRecord &record, std::vector<byte> &out);
NetStatus decode_record(NetWireRecord &record, const std::vector<byte> &bytes);

int run_core_tests();
int run_negotiate_tests();
int run_session_tests();
int run_create_tests();
int run_fileio_tests();
int run_ioctl_tests();
int run_notify_tests();
int run_setinfo_tests();
int run_querydirectory_tests();
int run_error_tests();

#endif // include_unittests
