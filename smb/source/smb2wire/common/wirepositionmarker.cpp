//
// wirepositionmarker.cpp -
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

#include "wirepositionmarker.hpp"

NetStatus NetWirePositionMarkerBase::write_placeholder(NetStreamOutputBuffer &StreamBuffer)
{
  position     = StreamBuffer.stream_position();
  marker_value = 0;
  is_resolved  = false;
  return StreamBuffer.push_zeros(marker_width);
}

NetStatus NetWirePositionMarkerBase::resolve(NetStreamOutputBuffer &StreamBuffer, ddword value)
{
  if (!fits(value))
  {
    diag_printf_fn(DIAG_DEBUG, "NetWirePositionMarker: value %llu does not fit %d byte field at %u\n", (unsigned long long)value, marker_width, position);
    return NetStatusEncodingOverflow;
  }
  byte raw_address[8];
  netwire_store_le(raw_address, value, marker_width);
  dword return_position = StreamBuffer.stream_position();
  PROPAGATE_NETSTATUS(StreamBuffer.seek_to(position));
  PROPAGATE_NETSTATUS(StreamBuffer.push_to_buffer(raw_address, marker_width));
  PROPAGATE_NETSTATUS(StreamBuffer.seek_to(return_position));
  marker_value = value;
  is_resolved  = true;
  return NetStatusOk;
}

NetStatus NetWirePositionMarkerBase::resolve_relative(NetStreamOutputBuffer &StreamBuffer, ddword anchor_position)
{
  ddword current = StreamBuffer.stream_position();
  if (anchor_position > current)
  {
    diag_printf_fn(DIAG_DEBUG, "NetWirePositionMarker: anchor %llu lies after write position %llu\n", (unsigned long long)anchor_position, (unsigned long long)current);
    return NetStatusEncodingOverflow;
  }
  return resolve(StreamBuffer, current - anchor_position);
}

NetStatus NetWirePositionMarkerBase::read(NetStreamInputBuffer &StreamBuffer)
{
  byte raw_address[8];
  position = StreamBuffer.stream_position();
  PROPAGATE_NETSTATUS(StreamBuffer.pull_input(raw_address, marker_width));
  marker_value = netwire_load_le(raw_address, marker_width);
  is_resolved  = true;
  return NetStatusOk;
}

bool NetWireAnchor::position(dword record_start, ddword &anchor_position) const
{
  long long base = 0;
  switch (kind)
  {
    case StreamStart:    base = 0; break;
    case RecordStart:    base = record_start; break;
    case MarkerPosition: base = marker ? marker->recorded_position() : 0; break;
  }
  base += adjust;
  if (base < 0)
    return false;
  anchor_position = (ddword) base;
  return true;
}

NetStatus NetWireMarkerLedger::verify_all_resolved() const
{
  for (size_t i = 0; i < pending.size(); i++)
  {
    if (!pending[i]->resolved())
    {
      diag_printf_fn(DIAG_DEBUG, "%s: placeholder at %u was never resolved\n", owner_name, pending[i]->recorded_position());
      return NetStatusUnresolvedMarker;
    }
  }
  return NetStatusOk;
}
