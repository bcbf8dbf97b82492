//
// wirepositionmarker.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Offset and length fields whose value is only known after later fields are
//  written. Encoding emits a zeroed placeholder and patches it in place once
//  the referenced payload has been placed. Decoding reads the value and keeps
//  the position so it can serve as an anchor for other offsets.
//
#ifndef include_wirepositionmarker
#define include_wirepositionmarker

#include "wireobjects.hpp"

class NetWirePositionMarkerBase : public NetWireRecord {
public:
  NetWirePositionMarkerBase(int width) { marker_width=width; position=0; marker_value=0; is_resolved=false; }

  NetStatus write_placeholder(NetStreamOutputBuffer &StreamBuffer);
  /// Seek to the placeholder, write value, seek back.
  NetStatus resolve(NetStreamOutputBuffer &StreamBuffer, ddword value);
  /// value = current write position - anchor_position
  NetStatus resolve_relative(NetStreamOutputBuffer &StreamBuffer, ddword anchor_position);
  NetStatus read(NetStreamInputBuffer &StreamBuffer);

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer) { return write_placeholder(StreamBuffer); }
  NetStatus decode(NetStreamInputBuffer &StreamBuffer)  { return read(StreamBuffer); }

  dword  recorded_position() const { return position; }
  ddword value()             const { return marker_value; }
  int    width()             const { return marker_width; }
  bool   resolved()          const { return is_resolved; }
  bool   fits(ddword v)      const { return marker_width >= 8 || v < ((ddword)1 << (8*marker_width)); }
private:
  int    marker_width;
  dword  position;
  ddword marker_value;
  bool   is_resolved;
};

template <class T>
class NetWirePositionMarker : public NetWirePositionMarkerBase {
public:
  NetWirePositionMarker() : NetWirePositionMarkerBase(sizeof(T)) {}
  T operator()() const { return (T) value(); }
};

typedef NetWirePositionMarker<byte>   NetWireMarker8;
typedef NetWirePositionMarker<word>   NetWireMarker16;
typedef NetWirePositionMarker<dword>  NetWireMarker32;

/// Reference point an offset is measured from.
class NetWireAnchor {
public:
  enum AnchorKind { StreamStart, RecordStart, MarkerPosition };
  NetWireAnchor() { kind=StreamStart; marker=0; adjust=0; }

  static NetWireAnchor stream_start()                { return NetWireAnchor(StreamStart, 0, 0); }
  static NetWireAnchor record_start(long adjust=0)   { return NetWireAnchor(RecordStart, 0, adjust); }
  static NetWireAnchor marker_position(const NetWirePositionMarkerBase &marker, long adjust=0) { return NetWireAnchor(MarkerPosition, &marker, adjust); }

  /// Absolute anchor position. False if it would fall before the stream start.
  bool position(dword record_start, ddword &anchor_position) const;
private:
  NetWireAnchor(AnchorKind _kind, const NetWirePositionMarkerBase *_marker, long _adjust) { kind=_kind; marker=_marker; adjust=_adjust; }
  AnchorKind kind;
  const NetWirePositionMarkerBase *marker;
  long adjust;
};

/// Placeholders written during one structure encode. Every entry must be
/// resolved before the structure's encode returns.
class NetWireMarkerLedger {
public:
  NetWireMarkerLedger(const char *_owner_name) { owner_name=_owner_name; }
  NetStatus write_placeholder(NetWirePositionMarkerBase &marker, NetStreamOutputBuffer &StreamBuffer)
  {
    pending.push_back(&marker);
    return marker.write_placeholder(StreamBuffer);
  }
  NetStatus verify_all_resolved() const;
private:
  const char *owner_name;
  std::vector<const NetWirePositionMarkerBase *> pending;
};

#endif // include_wirepositionmarker
