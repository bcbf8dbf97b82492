//
// wiresizedstring.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//
//

#include "wiresizedstring.hpp"

NetStatus NetWireSizedString::encode(NetStreamOutputBuffer &StreamBuffer, dword &byte_count)
{
  byte raw_address[2];
  byte_count = 0;
  for (size_t i = 0; i < units.size(); i++)
  {
    HTONETWORD(units[i]);
    PROPAGATE_NETSTATUS(StreamBuffer.push_to_buffer(raw_address, 2));
  }
  byte_count = byte_length();
  return NetStatusOk;
}

NetStatus NetWireSizedString::decode(NetStreamInputBuffer &StreamBuffer, dword byte_count)
{
  units.clear();
  if (byte_count & 1)
  {
    diag_printf_fn(DIAG_DEBUG, "NetWireSizedString: odd byte length %u at %u\n", byte_count, StreamBuffer.stream_position());
    return NetStatusStructuralViolation;
  }
  if (byte_count > StreamBuffer.bytes_remaining())
  {
    diag_printf_fn(DIAG_DEBUG, "NetWireSizedString: %u bytes requested, %u remain\n", byte_count, StreamBuffer.bytes_remaining());
    return NetStatusBoundsViolation;
  }
  units.reserve(byte_count/2);
  for (dword i = 0; i < byte_count/2; i++)
  {
    byte raw_address[2];
    word w;
    PROPAGATE_NETSTATUS(StreamBuffer.pull_input(raw_address, 2));
    NETTOHWORD(w);
    units.push_back(w);
  }
  return NetStatusOk;
}

NetStatus NetWireAsciizString::encode(NetStreamOutputBuffer &StreamBuffer)
{
  if (value.find('\0') != std::string::npos)
  {
    diag_printf_fn(DIAG_DEBUG, "NetWireAsciizString: embedded terminator\n");
    return NetStatusBadCallParms;
  }
  return StreamBuffer.push_to_buffer((const byte *) value.c_str(), (dword) value.size() + 1);
}

NetStatus NetWireAsciizString::decode(NetStreamInputBuffer &StreamBuffer)
{
  value.clear();
  for (;;)
  {
    byte c;
    if (StreamBuffer.bytes_remaining() == 0)
    {
      diag_printf_fn(DIAG_DEBUG, "NetWireAsciizString: no terminator before %u\n", StreamBuffer.stream_position());
      return NetStatusBoundsViolation;
    }
    PROPAGATE_NETSTATUS(StreamBuffer.pull_input(&c, 1));
    if (c == 0)
      return NetStatusOk;
    value += (char) c;
  }
}
