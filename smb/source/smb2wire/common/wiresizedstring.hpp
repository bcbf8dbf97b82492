//
// wiresizedstring.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  UTF-16LE string whose byte length travels in a sibling field.
//  No terminator and no byte order mark on the wire.
//  Also the null terminated 8 bit strings of SMB1 dialect lists.
//
#ifndef include_wiresizedstring
#define include_wiresizedstring

#include "wireobjects.hpp"

class NetWireSizedString : public NetWireRecord {
public:
  NetWireSizedString() {}
  NetWireSizedString(const char *ascii_string) { smb2wire_util_ascii_to_unicode(ascii_string, units); }
  void operator =(const char *ascii_string) { smb2wire_util_ascii_to_unicode(ascii_string, units); }
  void operator =(const std::vector<word> &utf16) { units = utf16; }
  const std::vector<word> &operator()() const { return units; }
  bool operator ==(const NetWireSizedString &other) const { return units == other.units; }
  bool operator ==(const char *ascii_string) const { return ascii() == ascii_string; }

  std::string ascii() const { return smb2wire_util_unicode_to_ascii(units); }
  dword utf16_length() const { return (dword) units.size(); }
  dword byte_length()  const { return (dword) units.size()*2; }

  /// Writes the code units and reports the byte count for the sibling length field.
  NetStatus encode(NetStreamOutputBuffer &StreamBuffer, dword &byte_count);
  /// Reads exactly byte_count bytes. Odd counts are a NetStatusStructuralViolation.
  NetStatus decode(NetStreamInputBuffer &StreamBuffer, dword byte_count);

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer) { dword byte_count; return encode(StreamBuffer, byte_count); }
  // Inside a bounded region the string is the whole region
  NetStatus decode(NetStreamInputBuffer &StreamBuffer)  { return decode(StreamBuffer, StreamBuffer.bytes_remaining()); }
  bool wire_empty() const { return units.empty(); }
  void wire_clear() { units.clear(); }
private:
  std::vector<word> units;
};

/// 8 bit characters followed by a 0 byte. The terminator must be inside the region.
class NetWireAsciizString : public NetWireRecord {
public:
  NetWireAsciizString() {}
  NetWireAsciizString(const char *ascii_string) { value = ascii_string; }
  void operator =(const char *ascii_string) { value = ascii_string; }
  const std::string &operator()() const { return value; }
  bool operator ==(const char *ascii_string) const { return value == ascii_string; }

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer);
  NetStatus decode(NetStreamInputBuffer &StreamBuffer);
private:
  std::string value;
};

#endif // include_wiresizedstring
