//
// netstreambuffer.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Seekable in memory streams the wire codec encodes to and decodes from.
//
#ifndef include_netstreambuffer
#define include_netstreambuffer

#include "smb2defs.hpp"

/// Seekable output stream. Grows on demand unless a fixed buffer is attached.
/// Placeholders written earlier are patched by seeking back, writing and seeking forward again.
class NetStreamOutputBuffer     {
public:
   NetStreamOutputBuffer()                              { buffer_base=0; buffer_size=0; bytes_buffered=0; write_pointer=0; attached=false; }
   ~NetStreamOutputBuffer()                             {};
  /// Encode into caller storage instead of the internal vector. Pushing past byte_count returns NetStatusFull.
  void attach_buffer(byte *data, dword byte_count){ buffer_base=data; buffer_size=byte_count; bytes_buffered = 0; write_pointer=0; attached=true; owned.clear(); }
  void empty() { bytes_buffered = 0; write_pointer=0; if (!attached) owned.clear(); }

  NetStatus push_to_buffer(const byte *output, dword byte_count);
  NetStatus push_zeros(dword byte_count);
  /// Write (boundary - position % boundary) % boundary zero bytes.
  NetStatus pad_to(dword boundary);
  /// Move the write cursor. Only positions already written to are reachable.
  NetStatus seek_to(ddword position);

  dword stream_position() const { return write_pointer; }
  dword buffered_count()  const { return bytes_buffered; }
  const byte *buffered_data() const { return attached ? buffer_base : (owned.empty() ? 0 : &owned[0]); }
  std::vector<byte> contents() const;
private:
  byte *writable_base() { return attached ? buffer_base : &owned[0]; }
  NetStatus make_room(dword byte_count);
  std::vector<byte> owned;
  byte *buffer_base;
  dword buffer_size;
  dword bytes_buffered;
  dword write_pointer;
  bool  attached;
};

/// Seekable input stream over one complete message held in memory.
/// Reads are confined to the current region, which is the whole buffer
/// unless a NetStreamBoundedRegion has narrowed it.
class NetStreamInputBuffer     {
public:
   NetStreamInputBuffer()                              { attach_buffer(0, 0); }
   NetStreamInputBuffer(const byte *data, dword byte_count) { attach_buffer(data, byte_count); }
   ~NetStreamInputBuffer()                             {};
   void attach_buffer(const byte *data, dword byte_count) { buffer_base=data; buffer_size=byte_count; read_pointer=0; region_start=0; region_end=byte_count; }

   NetStatus pull_input(byte *to, dword byte_count);
   NetStatus peek_input(byte *to, dword byte_count) const;
   NetStatus skip_input(dword byte_count);
   NetStatus skip_to_alignment(dword boundary);
   /// Absolute seek. The target must lie inside the current region.
   NetStatus seek_to(ddword position);

   dword stream_position() const { return read_pointer; }
   dword bytes_remaining() const { return region_end - read_pointer; }
   dword region_base()     const { return region_start; }
   dword region_limit()    const { return region_end; }
   const byte *input_address() const { return buffer_base ? buffer_base+read_pointer : 0; }
private:
   friend class NetStreamBoundedRegion;
   const byte *buffer_base;
   dword buffer_size;
   dword read_pointer;
   dword region_start;
   dword region_end;
};

/// Take view: narrows an input stream to [position, position+length) for one nested decode.
/// Closing restores the enclosing limits and leaves the cursor at the region end.
class NetStreamBoundedRegion {
public:
  NetStreamBoundedRegion(NetStreamInputBuffer &_stream) : stream(_stream) { is_open=false; saved_start=0; saved_end=0; }
  ~NetStreamBoundedRegion() { close(); }
  NetStatus open(dword length);
  void close();
private:
  NetStreamInputBuffer &stream;
  bool  is_open;
  dword saved_start;
  dword saved_end;
};

#endif // include_netstreambuffer
