//
// netstreambuffer.cpp -
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

#include "smb2defs.hpp"
#include "netstreambuffer.hpp"

static dword padding_for(dword position, dword boundary)
{
  if (boundary <= 1)
    return 0;
  return (boundary - (position % boundary)) % boundary;
}

NetStatus NetStreamOutputBuffer::make_room(dword byte_count)
{
  ddword needed = (ddword)write_pointer + byte_count;
  if (attached)
  {
    if (needed > buffer_size)
    {
      diag_printf_fn(DIAG_DEBUG, "NetStreamOutputBuffer: %u bytes at %u overruns attached buffer of %u\n", byte_count, write_pointer, buffer_size);
      return NetStatusFull;
    }
    return NetStatusOk;
  }
  if (needed > SMB2WIRE_CFG_MAX_BUFFER_SIZE)
  {
    diag_printf_fn(DIAG_DEBUG, "NetStreamOutputBuffer: growth to %llu exceeds SMB2WIRE_CFG_MAX_BUFFER_SIZE\n", (unsigned long long)needed);
    return NetStatusFull;
  }
  if (needed > owned.size())
    owned.resize((size_t)needed);
  return NetStatusOk;
}

NetStatus NetStreamOutputBuffer::push_to_buffer(const byte *output, dword byte_count)
{
  if (byte_count == 0)
    return NetStatusOk;
  PROPAGATE_NETSTATUS(make_room(byte_count));
  tc_memcpy(writable_base()+write_pointer, output, byte_count);
  write_pointer += byte_count;
  bytes_buffered = std::max(bytes_buffered, write_pointer);
  return NetStatusOk;
}

NetStatus NetStreamOutputBuffer::push_zeros(dword byte_count)
{
  if (byte_count == 0)
    return NetStatusOk;
  PROPAGATE_NETSTATUS(make_room(byte_count));
  tc_memset(writable_base()+write_pointer, 0, byte_count);
  write_pointer += byte_count;
  bytes_buffered = std::max(bytes_buffered, write_pointer);
  return NetStatusOk;
}

NetStatus NetStreamOutputBuffer::pad_to(dword boundary)
{
  return push_zeros(padding_for(write_pointer, boundary));
}

NetStatus NetStreamOutputBuffer::seek_to(ddword position)
{
  if (position > bytes_buffered)
  {
    diag_printf_fn(DIAG_DEBUG, "NetStreamOutputBuffer: seek to %llu past %u written bytes\n", (unsigned long long)position, bytes_buffered);
    return NetStatusBoundsViolation;
  }
  write_pointer = (dword) position;
  return NetStatusOk;
}

std::vector<byte> NetStreamOutputBuffer::contents() const
{
  const byte *p = buffered_data();
  if (!p)
    return std::vector<byte>();
  return std::vector<byte>(p, p+bytes_buffered);
}

NetStatus NetStreamInputBuffer::peek_input(byte *to, dword byte_count) const
{
  if (byte_count > bytes_remaining())
  {
    diag_printf_fn(DIAG_DEBUG, "NetStreamInputBuffer: read of %u at %u crosses region end %u\n", byte_count, read_pointer, region_end);
    return NetStatusBoundsViolation;
  }
  if (byte_count)
    tc_memcpy(to, buffer_base+read_pointer, byte_count);
  return NetStatusOk;
}

NetStatus NetStreamInputBuffer::pull_input(byte *to, dword byte_count)
{
  PROPAGATE_NETSTATUS(peek_input(to, byte_count));
  read_pointer += byte_count;
  return NetStatusOk;
}

NetStatus NetStreamInputBuffer::skip_input(dword byte_count)
{
  if (byte_count > bytes_remaining())
  {
    diag_printf_fn(DIAG_DEBUG, "NetStreamInputBuffer: skip of %u at %u crosses region end %u\n", byte_count, read_pointer, region_end);
    return NetStatusBoundsViolation;
  }
  read_pointer += byte_count;
  return NetStatusOk;
}

NetStatus NetStreamInputBuffer::skip_to_alignment(dword boundary)
{
  dword padding = padding_for(read_pointer, boundary);
#if (SMB2WIRE_CFG_VERIFY_PADDING)
  for (dword i = 0; i < padding && read_pointer+i < region_end; i++)
  {
    if (buffer_base[read_pointer+i] != 0)
    {
      diag_printf_fn(DIAG_DEBUG, "NetStreamInputBuffer: non zero padding byte at %u\n", read_pointer+i);
      return NetStatusStructuralViolation;
    }
  }
#endif
  return skip_input(padding);
}

NetStatus NetStreamInputBuffer::seek_to(ddword position)
{
  if (position < region_start || position > region_end)
  {
    diag_printf_fn(DIAG_DEBUG, "NetStreamInputBuffer: seek to %llu outside region [%u,%u)\n", (unsigned long long)position, region_start, region_end);
    return NetStatusBoundsViolation;
  }
  read_pointer = (dword) position;
  return NetStatusOk;
}

NetStatus NetStreamBoundedRegion::open(dword length)
{
  if (is_open)
    return NetStatusBadCallParms;
  if (length > stream.bytes_remaining())
  {
    diag_printf_fn(DIAG_DEBUG, "NetStreamBoundedRegion: region of %u at %u exceeds limit %u\n", length, stream.read_pointer, stream.region_end);
    return NetStatusBoundsViolation;
  }
  saved_start = stream.region_start;
  saved_end   = stream.region_end;
  stream.region_start = stream.read_pointer;
  stream.region_end   = stream.read_pointer + length;
  is_open = true;
  return NetStatusOk;
}

void NetStreamBoundedRegion::close()
{
  if (!is_open)
    return;
  stream.read_pointer = stream.region_end;
  stream.region_start = saved_start;
  stream.region_end   = saved_end;
  is_open = false;
}
