//
// wirefieldtable.cpp -
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

#include "wirefieldtable.hpp"
#include "wiretagged.hpp"

NetWireFieldDescriptor::NetWireFieldDescriptor(FieldKind _kind, const char *_name)
{
  kind = _kind;
  name = _name;
  record = 0;
  fixed = 0;
  marker = 0;
  counted_list = 0;
  constant_value = 0;
  reserved_must_be_zero = false;
  payload_alignment = 0;
  offset_marker = 0;
  length_marker = 0;
  offset_alignment = 0;
  is_optional = false;
}

NetWireFieldDescriptor &NetWireFieldTable::add(NetWireFieldDescriptor::FieldKind kind, const char *name)
{
  fields.push_back(NetWireFieldDescriptor(kind, name));
  return fields.back();
}

NetWireFieldDescriptor &NetWireFieldTable::field(NetWireRecord &record, const char *name)
{
  NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldFixed, name);
  d.record = &record;
  return d;
}

NetWireFieldDescriptor &NetWireFieldTable::reserved(NetWire &wire_field, const char *name)
{
  NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldReserved, name);
  d.record = &wire_field;
  d.fixed = &wire_field;
  return d;
}

NetWireFieldDescriptor &NetWireFieldTable::marker(NetWirePositionMarkerBase &marker, const char *name)
{
  NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldMarker, name);
  d.marker = &marker;
  return d;
}

NetWireFieldDescriptor &NetWireFieldTable::count(NetWirePositionMarkerBase &marker, NetWireCountedList &list, const char *name)
{
  NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldCount, name);
  d.marker = &marker;
  d.counted_list = &list;
  return d;
}

NetWireFieldDescriptor &NetWireFieldTable::align(dword boundary)
{
  NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldAlign, "align");
  d.payload_alignment = boundary;
  return d;
}

NetWireFieldDescriptor &NetWireFieldTable::payload(NetWireRecord &record, const char *name)
{
  NetWireFieldDescriptor &d = add(NetWireFieldDescriptor::FieldPayload, name);
  d.record = &record;
  return d;
}

NetWireTaggedBase *NetWireFieldTable::tagged_payload(NetWireFieldDescriptor &d)
{
  NetWireTaggedBase *tagged = dynamic_cast<NetWireTaggedBase *>(d.record);
  if (!tagged)
    diag_printf_fn(DIAG_DEBUG, "%s.%s: tag sources bound to a payload that is not a tagged record\n", owner_name, d.name);
  return tagged;
}

// Encode side: the variant present decides the discriminant, copy its wire bytes into the tag source fields
NetStatus NetWireFieldTable::transfer_discriminant(NetWireFieldDescriptor &d)
{
  NetWireTaggedBase *tagged = tagged_payload(d);
  ASSURE(tagged, NetStatusBadCallParms);
  std::string key;
  PROPAGATE_NETSTATUS(tagged->variant_discriminant(key));
  NetStreamInputBuffer KeyStream((const byte *) key.data(), (dword) key.size());
  for (size_t i = 0; i < d.tag_sources.size(); i++)
  {
    if (d.tag_sources[i]->decode(KeyStream) != NetStatusOk)
    {
      diag_printf_fn(DIAG_DEBUG, "%s.%s: discriminant %s is too short for its tag fields\n", owner_name, d.name, netwire_key_text(key).c_str());
      return NetStatusEncodingOverflow;
    }
  }
  if (KeyStream.bytes_remaining())
  {
    diag_printf_fn(DIAG_DEBUG, "%s.%s: discriminant %s does not fit its tag fields\n", owner_name, d.name, netwire_key_text(key).c_str());
    return NetStatusEncodingOverflow;
  }
  return NetStatusOk;
}

// Decode side: rebuild the discriminant from the tag source fields and pick the variant
NetStatus NetWireFieldTable::select_discriminant(NetWireFieldDescriptor &d)
{
  NetWireTaggedBase *tagged = tagged_payload(d);
  ASSURE(tagged, NetStatusBadCallParms);
  NetStreamOutputBuffer KeyStream;
  for (size_t i = 0; i < d.tag_sources.size(); i++)
    PROPAGATE_NETSTATUS(d.tag_sources[i]->encode(KeyStream));
  std::vector<byte> key = KeyStream.contents();
  return tagged->select_variant(key.empty() ? std::string() : netwire_key(&key[0], (dword) key.size()));
}

NetStatus NetWireFieldTable::encode(NetStreamOutputBuffer &StreamBuffer)
{
  for (size_t i = 0; i < fields.size(); i++)
  {
    if (fields[i].kind == NetWireFieldDescriptor::FieldPayload && !fields[i].tag_sources.empty())
      PROPAGATE_NETSTATUS(transfer_discriminant(fields[i]));
  }
  record_start = StreamBuffer.stream_position();
  for (size_t i = 0; i < fields.size(); i++)
  {
    NetWireFieldDescriptor &d = fields[i];
    switch (d.kind)
    {
      case NetWireFieldDescriptor::FieldFixed:
      case NetWireFieldDescriptor::FieldConstant:
        PROPAGATE_NETSTATUS(d.record->encode(StreamBuffer));
        break;
      case NetWireFieldDescriptor::FieldReserved:
        PROPAGATE_NETSTATUS(StreamBuffer.push_zeros(d.fixed->wire_size()));
        break;
      case NetWireFieldDescriptor::FieldMarker:
        PROPAGATE_NETSTATUS(ledger.write_placeholder(*d.marker, StreamBuffer));
        break;
      case NetWireFieldDescriptor::FieldCount:
        PROPAGATE_NETSTATUS(ledger.write_placeholder(*d.marker, StreamBuffer));
        PROPAGATE_NETSTATUS(d.marker->resolve(StreamBuffer, d.counted_list->element_count()));
        break;
      case NetWireFieldDescriptor::FieldAlign:
        PROPAGATE_NETSTATUS(StreamBuffer.pad_to(d.payload_alignment));
        break;
      case NetWireFieldDescriptor::FieldPayload:
        PROPAGATE_NETSTATUS(encode_payload(d, StreamBuffer));
        break;
    }
  }
  return ledger.verify_all_resolved();
}

NetStatus NetWireFieldTable::encode_payload(NetWireFieldDescriptor &d, NetStreamOutputBuffer &StreamBuffer)
{
  if (d.is_optional && d.record->wire_empty())
  {
    if (d.offset_marker)
      PROPAGATE_NETSTATUS(d.offset_marker->resolve(StreamBuffer, 0));
    if (d.length_marker)
      PROPAGATE_NETSTATUS(d.length_marker->resolve(StreamBuffer, 0));
    return NetStatusOk;
  }
  PROPAGATE_NETSTATUS(StreamBuffer.pad_to(d.payload_alignment));
  if (d.offset_marker)
  {
    ddword anchor_position;
    if (!d.anchor.position(record_start, anchor_position))
    {
      diag_printf_fn(DIAG_DEBUG, "%s.%s: offset anchor lies before the stream start\n", owner_name, d.name);
      return NetStatusEncodingOverflow;
    }
    PROPAGATE_NETSTATUS(d.offset_marker->resolve_relative(StreamBuffer, anchor_position));
  }
  dword payload_start = StreamBuffer.stream_position();
  PROPAGATE_NETSTATUS(d.record->encode(StreamBuffer));
  if (d.length_marker)
  {
    NetStatus r = d.length_marker->resolve(StreamBuffer, StreamBuffer.stream_position() - payload_start);
    if (r != NetStatusOk)
      diag_printf_fn(DIAG_DEBUG, "%s.%s: payload of %u bytes does not fit its length field\n", owner_name, d.name, StreamBuffer.stream_position() - payload_start);
    return r;
  }
  return NetStatusOk;
}

NetStatus NetWireFieldTable::decode(NetStreamInputBuffer &StreamBuffer)
{
  record_start = StreamBuffer.stream_position();
  for (size_t i = 0; i < fields.size(); i++)
  {
    NetWireFieldDescriptor &d = fields[i];
    switch (d.kind)
    {
      case NetWireFieldDescriptor::FieldFixed:
        PROPAGATE_NETSTATUS(d.record->decode(StreamBuffer));
        break;
      case NetWireFieldDescriptor::FieldConstant:
      case NetWireFieldDescriptor::FieldReserved:
      {
        byte raw_address[NETWIRE_MAX_FIXED_SIZE];
        dword width = d.fixed->wire_size();
        PROPAGATE_NETSTATUS(StreamBuffer.peek_input(raw_address, width));
        if (d.kind == NetWireFieldDescriptor::FieldConstant)
        {
          ddword found = netwire_load_le(raw_address, width);
          if (found != d.constant_value)
          {
            diag_printf_fn(DIAG_DEBUG, "%s.%s: expected %llu found %llu\n", owner_name, d.name, (unsigned long long)d.constant_value, (unsigned long long)found);
            return NetStatusStructuralViolation;
          }
        }
        else if (d.reserved_must_be_zero)
        {
          for (dword b = 0; b < width; b++)
          {
            if (raw_address[b])
            {
              diag_printf_fn(DIAG_DEBUG, "%s.%s: reserved field is not zero\n", owner_name, d.name);
              return NetStatusStructuralViolation;
            }
          }
        }
        PROPAGATE_NETSTATUS(d.record->decode(StreamBuffer));
        break;
      }
      case NetWireFieldDescriptor::FieldMarker:
        PROPAGATE_NETSTATUS(d.marker->read(StreamBuffer));
        break;
      case NetWireFieldDescriptor::FieldCount:
        PROPAGATE_NETSTATUS(d.marker->read(StreamBuffer));
        PROPAGATE_NETSTATUS(d.counted_list->expect_elements((dword) d.marker->value()));
        break;
      case NetWireFieldDescriptor::FieldAlign:
        PROPAGATE_NETSTATUS(StreamBuffer.skip_to_alignment(d.payload_alignment));
        break;
      case NetWireFieldDescriptor::FieldPayload:
        PROPAGATE_NETSTATUS(decode_payload(d, StreamBuffer));
        break;
    }
  }
  return NetStatusOk;
}

// Sibling count of a counted list payload, false when the payload has none
bool NetWireFieldTable::sibling_count(NetWireFieldDescriptor &d, ddword &count)
{
  for (size_t i = 0; i < fields.size(); i++)
  {
    if (fields[i].kind == NetWireFieldDescriptor::FieldCount && fields[i].counted_list == d.record)
    {
      count = fields[i].marker->value();
      return true;
    }
  }
  return false;
}

NetStatus NetWireFieldTable::decode_payload(NetWireFieldDescriptor &d, NetStreamInputBuffer &StreamBuffer)
{
  ddword offset = d.offset_marker ? d.offset_marker->value() : 0;
  ddword length = d.length_marker ? d.length_marker->value() : 0;

  if (d.is_optional)
  {
    ddword count = 0;
    bool counted = sibling_count(d, count);
    bool absent = (d.offset_marker && offset == 0) || (d.length_marker && length == 0);
    if (absent && counted && count)
    {
      diag_printf_fn(DIAG_DEBUG, "%s.%s: %llu elements counted but offset %llu length %llu\n", owner_name, d.name,
                     (unsigned long long)count, (unsigned long long)offset, (unsigned long long)length);
      return NetStatusStructuralViolation;
    }
    if (absent || (counted && count == 0))
    {
      d.record->wire_clear();
      return NetStatusOk;
    }
  }
  if (d.offset_marker && d.offset_alignment && (offset % d.offset_alignment))
  {
    diag_printf_fn(DIAG_DEBUG, "%s.%s: offset %llu is not a multiple of %u\n", owner_name, d.name, (unsigned long long)offset, d.offset_alignment);
    return NetStatusAlignmentViolation;
  }
  // Zero length payloads decode from an empty region. The offset is followed only when it stays inside the region.
  if (d.length_marker && length == 0)
  {
    ddword anchor_position;
    if (d.offset_marker && offset && d.anchor.position(record_start, anchor_position)
        && anchor_position + offset >= StreamBuffer.region_base() && anchor_position + offset <= StreamBuffer.region_limit())
      PROPAGATE_NETSTATUS(StreamBuffer.seek_to(anchor_position + offset));
    return decode_payload_body(d, StreamBuffer, true);
  }
  if (d.offset_marker)
  {
    if (offset == 0)
    {
      if (d.length_marker)
      {
        diag_printf_fn(DIAG_DEBUG, "%s.%s: %llu bytes at offset 0\n", owner_name, d.name, (unsigned long long)length);
        return NetStatusStructuralViolation;
      }
      return decode_payload_body(d, StreamBuffer, true);
    }
    ddword anchor_position;
    if (!d.anchor.position(record_start, anchor_position))
    {
      diag_printf_fn(DIAG_DEBUG, "%s.%s: offset anchor lies before the stream start\n", owner_name, d.name);
      return NetStatusBoundsViolation;
    }
    PROPAGATE_NETSTATUS(StreamBuffer.seek_to(anchor_position + offset));
  }
  else
    PROPAGATE_NETSTATUS(StreamBuffer.skip_to_alignment(d.payload_alignment));
  return decode_payload_body(d, StreamBuffer, false);
}

NetStatus NetWireFieldTable::decode_payload_body(NetWireFieldDescriptor &d, NetStreamInputBuffer &StreamBuffer, bool empty_region)
{
  if (!d.tag_sources.empty())
    PROPAGATE_NETSTATUS(select_discriminant(d));
  if (!empty_region && !d.length_marker)
    return d.record->decode(StreamBuffer);

  ddword length = empty_region ? 0 : d.length_marker->value();
  if (length > StreamBuffer.bytes_remaining())
  {
    diag_printf_fn(DIAG_DEBUG, "%s.%s: length %llu at %u crosses region end %u\n", owner_name, d.name, (unsigned long long)length, StreamBuffer.stream_position(), StreamBuffer.region_limit());
    return NetStatusBoundsViolation;
  }
  NetStreamBoundedRegion Region(StreamBuffer);
  PROPAGATE_NETSTATUS(Region.open((dword) length));
  PROPAGATE_NETSTATUS(d.record->decode(StreamBuffer));
  Region.close();
  return NetStatusOk;
}

NetStatus NetWireStruct::encode(NetStreamOutputBuffer &StreamBuffer)
{
  PROPAGATE_NETSTATUS(PrepareEncode());
  NetWireFieldTable T(command_name());
  BindFields(T);
  return T.encode(StreamBuffer);
}

NetStatus NetWireStruct::decode(NetStreamInputBuffer &StreamBuffer)
{
  NetWireFieldTable T(command_name());
  BindFields(T);
  PROPAGATE_NETSTATUS(T.decode(StreamBuffer));
  PROPAGATE_NETSTATUS(ValidateDecoded());
  show_contents();
  return NetStatusOk;
}
