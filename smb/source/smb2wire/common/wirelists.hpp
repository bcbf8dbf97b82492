//
// wirelists.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Repeated wire records.
//   NetWireArray<T>             - elements back to back, bounded by a sibling count or by the region
//   NetWireChainedList<T, PAD>  - elements linked by a leading u32 NextEntryOffset, last one is 0
//
#ifndef include_wirelists
#define include_wirelists

#include "wirepositionmarker.hpp"
#include "smb2diagnostics.hpp"

/// A list whose element count travels in a sibling field.
class NetWireCountedList : public NetWireRecord {
public:
  virtual dword element_count() const = 0;
  /// Called on decode once the sibling count has been read.
  virtual NetStatus expect_elements(dword count) = 0;
};

template <class T>
class NetWireArray : public NetWireCountedList {
public:
  NetWireArray(dword _element_alignment=0) { element_alignment=_element_alignment; count_bound=false; expected_count=0; }
  std::vector<T> items;

  void push_back(const T &item) { items.push_back(item); }
  size_t size() const { return items.size(); }
  T &operator[](size_t i) { return items[i]; }
  const T &operator[](size_t i) const { return items[i]; }

  dword element_count() const { return (dword) items.size(); }
  NetStatus expect_elements(dword count)
  {
    if (count > SMB2WIRE_CFG_MAX_ARRAY_ELEMENTS)
    {
      diag_printf_fn(DIAG_DEBUG, "NetWireArray: element count %u exceeds SMB2WIRE_CFG_MAX_ARRAY_ELEMENTS\n", count);
      return NetStatusBoundsViolation;
    }
    count_bound = true;
    expected_count = count;
    return NetStatusOk;
  }
  bool expecting_elements() const { return count_bound && expected_count > 0; }

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer)
  {
    for (size_t i = 0; i < items.size(); i++)
    {
      PROPAGATE_NETSTATUS(StreamBuffer.pad_to(element_alignment));
      PROPAGATE_NETSTATUS(items[i].encode(StreamBuffer));
    }
    return NetStatusOk;
  }
  // Without a sibling count, elements are read until the region is exhausted
  NetStatus decode(NetStreamInputBuffer &StreamBuffer)
  {
    items.clear();
    if (count_bound)
    {
      for (dword i = 0; i < expected_count; i++)
        PROPAGATE_NETSTATUS(decode_one(StreamBuffer));
      return NetStatusOk;
    }
    while (StreamBuffer.bytes_remaining())
    {
      if (items.size() >= SMB2WIRE_CFG_MAX_ARRAY_ELEMENTS)
      {
        diag_printf_fn(DIAG_DEBUG, "NetWireArray: more than SMB2WIRE_CFG_MAX_ARRAY_ELEMENTS elements in region\n");
        return NetStatusBoundsViolation;
      }
      PROPAGATE_NETSTATUS(decode_one(StreamBuffer));
    }
    return NetStatusOk;
  }
  bool wire_empty() const { return items.empty(); }
  void wire_clear() { items.clear(); }
private:
  NetStatus decode_one(NetStreamInputBuffer &StreamBuffer)
  {
    PROPAGATE_NETSTATUS(StreamBuffer.skip_to_alignment(element_alignment));
    T item;
    PROPAGATE_NETSTATUS(item.decode(StreamBuffer));
    items.push_back(item);
    return NetStatusOk;
  }
  dword element_alignment;
  bool  count_bound;
  dword expected_count;
};

/// Entries are padded to PAD relative to their own start before the next
/// NextEntryOffset. The last entry carries 0 and no trailing padding, so an
/// empty list occupies no bytes at all.
template <class T, int PAD>
class NetWireChainedList : public NetWireRecord {
public:
  NetWireChainedList() { strict_termination = true; }
  std::vector<T> items;

  void push_back(const T &item) { items.push_back(item); }
  size_t size() const { return items.size(); }
  T &operator[](size_t i) { return items[i]; }
  const T &operator[](size_t i) const { return items[i]; }
  /// When set (the default), bytes left in the region after the entry with
  /// NextEntryOffset 0 fail the decode with NetStatusStructuralViolation.
  void set_strict_termination(bool strict) { strict_termination = strict; }

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer)
  {
    for (size_t i = 0; i < items.size(); i++)
    {
      dword item_start = StreamBuffer.stream_position();
      NetWireMarker32 NextEntryOffset;
      PROPAGATE_NETSTATUS(NextEntryOffset.write_placeholder(StreamBuffer));
      PROPAGATE_NETSTATUS(items[i].encode(StreamBuffer));
      if (i+1 == items.size())
        break;
      dword used = StreamBuffer.stream_position() - item_start;
      PROPAGATE_NETSTATUS(StreamBuffer.push_zeros((PAD - (used % PAD)) % PAD));
      PROPAGATE_NETSTATUS(NextEntryOffset.resolve_relative(StreamBuffer, item_start));
    }
    return NetStatusOk;
  }

  NetStatus decode(NetStreamInputBuffer &StreamBuffer)
  {
    items.clear();
    if (StreamBuffer.bytes_remaining() == 0)
      return NetStatusOk;
    for (;;)
    {
      if (items.size() >= SMB2WIRE_CFG_MAX_CHAINED_ITEMS)
      {
        diag_printf_fn(DIAG_DEBUG, "NetWireChainedList: more than SMB2WIRE_CFG_MAX_CHAINED_ITEMS entries\n");
        return NetStatusBoundsViolation;
      }
      dword item_start = StreamBuffer.stream_position();
      NetWireMarker32 NextEntryOffset;
      PROPAGATE_NETSTATUS(NextEntryOffset.read(StreamBuffer));
      if (NextEntryOffset() % PAD)
      {
        diag_printf_fn(DIAG_DEBUG, "NetWireChainedList: NextEntryOffset %u at %u is not a multiple of %d\n", NextEntryOffset(), item_start, PAD);
        return NetStatusAlignmentViolation;
      }
      T item;
      PROPAGATE_NETSTATUS(item.decode(StreamBuffer));
      items.push_back(item);
      if (NextEntryOffset() == 0)
        break;
      PROPAGATE_NETSTATUS(StreamBuffer.seek_to((ddword)item_start + NextEntryOffset()));
    }
    if (StreamBuffer.bytes_remaining())
    {
      if (strict_termination)
      {
        diag_printf_fn(DIAG_DEBUG, "NetWireChainedList: %u bytes follow the last entry\n", StreamBuffer.bytes_remaining());
        return NetStatusStructuralViolation;
      }
      smb_diagnostics d;
      d.diag_text_warning("NetWireChainedList: ignoring %u bytes after the last entry", StreamBuffer.bytes_remaining());
    }
    return NetStatusOk;
  }
  bool wire_empty() const { return items.empty(); }
  void wire_clear() { items.clear(); }
private:
  bool strict_termination;
};

#endif // include_wirelists
