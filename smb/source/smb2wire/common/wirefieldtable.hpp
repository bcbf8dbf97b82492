//
// wirefieldtable.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Field table driver for NetWireStruct. A structure lists its fields once, in
//  wire order, from BindFields(). The same table drives encode and decode, so
//  placeholder patching, offset seeks, alignment and region bounds are handled
//  here and nowhere else.
//
//  Example:
//
//   void NetSmb2TreeConnectRequest::BindFields(NetWireFieldTable &T)
//   {
//     BINDCONSTANT(StructureSize, 9);
//     BINDFIELD(Flags);
//     BINDMARKER(PathOffset);
//     BINDMARKER(PathLength);
//     BINDPAYLOAD(Path).at_offset(PathOffset).sized_by(PathLength);
//   }
//
#ifndef include_wirefieldtable
#define include_wirefieldtable

#include "wireobjects.hpp"
#include "wirepositionmarker.hpp"
#include "wirelists.hpp"

class NetWireTaggedBase;

class NetWireFieldDescriptor {
public:
  enum FieldKind { FieldFixed, FieldConstant, FieldReserved, FieldMarker, FieldCount, FieldAlign, FieldPayload };
  NetWireFieldDescriptor(FieldKind _kind, const char *_name);

  // Payload options
  /// Zero pad to boundary before the payload.
  NetWireFieldDescriptor &aligned(dword boundary) { payload_alignment = boundary; return *this; }
  /// Payload position is carried in marker, measured from anchor.
  NetWireFieldDescriptor &at_offset(NetWirePositionMarkerBase &marker, const NetWireAnchor &_anchor=NetWireAnchor::stream_start())
  { offset_marker = &marker; anchor = _anchor; return *this; }
  /// Payload byte count is carried in marker. Decoding is confined to that many bytes.
  NetWireFieldDescriptor &sized_by(NetWirePositionMarkerBase &marker) { length_marker = &marker; return *this; }
  /// Decoded offsets that are not a multiple of boundary fail with NetStatusAlignmentViolation.
  NetWireFieldDescriptor &offset_must_align(dword boundary) { offset_alignment = boundary; return *this; }
  /// An empty payload is not written and its markers are 0. A 0 offset or length on the wire means absent,
  /// and a non zero sibling count alongside it fails with NetStatusStructuralViolation.
  NetWireFieldDescriptor &optional() { is_optional = true; return *this; }
  /// The payload is a tagged record whose discriminant is carried in the given sibling field(s).
  /// A variable length source (a context name) must be the last one.
  NetWireFieldDescriptor &tagged_by(NetWireRecord &source) { tag_sources.clear(); tag_sources.push_back(&source); return *this; }
  NetWireFieldDescriptor &tagged_by(NetWireRecord &first, NetWireRecord &second) { tagged_by(first); tag_sources.push_back(&second); return *this; }
  // Reserved option
  /// Non zero reserved bytes fail the decode with NetStatusStructuralViolation.
  NetWireFieldDescriptor &must_be_zero() { reserved_must_be_zero = true; return *this; }

private:
  friend class NetWireFieldTable;
  FieldKind kind;
  const char *name;
  NetWireRecord *record;
  NetWire *fixed;
  NetWirePositionMarkerBase *marker;
  NetWireCountedList *counted_list;
  ddword constant_value;
  bool reserved_must_be_zero;
  dword payload_alignment;
  NetWirePositionMarkerBase *offset_marker;
  NetWireAnchor anchor;
  NetWirePositionMarkerBase *length_marker;
  dword offset_alignment;
  bool is_optional;
  std::vector<NetWireRecord *> tag_sources;
};

class NetWireFieldTable {
public:
  NetWireFieldTable(const char *_owner_name) : ledger(_owner_name) { owner_name=_owner_name; record_start=0; }

  NetWireFieldDescriptor &field(NetWireRecord &record, const char *name);
  /// The field is set to value before encoding and must read back as value.
  template <class W>
  NetWireFieldDescriptor &constant(W &wire_field, ddword value, const char *name)
  {
    wire_field = value;
    NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldConstant, name);
    d.record = &wire_field;
    d.fixed = &wire_field;
    d.constant_value = value;
    return d;
  }
  /// Always written as zeros.
  NetWireFieldDescriptor &reserved(NetWire &wire_field, const char *name);
  NetWireFieldDescriptor &marker(NetWirePositionMarkerBase &marker, const char *name);
  /// marker carries the element count of list.
  NetWireFieldDescriptor &count(NetWirePositionMarkerBase &marker, NetWireCountedList &list, const char *name);
  NetWireFieldDescriptor &align(dword boundary);
  NetWireFieldDescriptor &payload(NetWireRecord &record, const char *name);

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer);
  NetStatus decode(NetStreamInputBuffer &StreamBuffer);
private:
  NetWireFieldDescriptor &add(NetWireFieldDescriptor::FieldKind kind, const char *name);
  NetStatus transfer_discriminant(NetWireFieldDescriptor &d);
  NetStatus select_discriminant(NetWireFieldDescriptor &d);
  NetStatus encode_payload(NetWireFieldDescriptor &d, NetStreamOutputBuffer &StreamBuffer);
  NetStatus decode_payload(NetWireFieldDescriptor &d, NetStreamInputBuffer &StreamBuffer);
  NetStatus decode_payload_body(NetWireFieldDescriptor &d, NetStreamInputBuffer &StreamBuffer, bool empty_region);
  bool sibling_count(NetWireFieldDescriptor &d, ddword &count);
  NetWireTaggedBase *tagged_payload(NetWireFieldDescriptor &d);

  const char *owner_name;
  std::vector<NetWireFieldDescriptor> fields;
  NetWireMarkerLedger ledger;
  dword record_start;
};

#endif // include_wirefieldtable
