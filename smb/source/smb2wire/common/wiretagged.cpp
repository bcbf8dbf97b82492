//
// wiretagged.cpp -
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

#include <cstdio>

#include "wiretagged.hpp"

std::string netwire_key(byte value)
{
  return std::string(1, (char) value);
}

std::string netwire_key(word value)
{
  byte raw_address[2];
  HTONETWORD(value);
  return std::string((const char *) raw_address, 2);
}

std::string netwire_key(dword value)
{
  byte raw_address[4];
  HTONETDWORD(value);
  return std::string((const char *) raw_address, 4);
}

std::string netwire_key(const char *name)
{
  return std::string(name);
}

std::string netwire_key(const byte *key_bytes, dword size)
{
  return std::string((const char *) key_bytes, size);
}

// Printable form for diagnostics, hex bytes
std::string netwire_key_text(const std::string &key)
{
  std::string r;
  char hex[4];
  for (size_t i = 0; i < key.size(); i++)
  {
    snprintf(hex, sizeof(hex), "%02x", (byte) key[i]);
    r += hex;
  }
  return r;
}

NetWireVariant *netwire_make_opaque_variant(const std::string &key)
{
  return new NetWireOpaqueVariant(key);
}

NetStatus NetWireVariantRegistry::create(const std::string &key, NetWireVariant *&variant) const
{
  std::map<std::string, NetWireVariantFactory>::const_iterator it = table.find(key);
  variant = 0;
  if (it != table.end())
    variant = it->second(key);
  else if (fallback)
    variant = fallback(key);
  else
  {
    diag_printf_fn(DIAG_DEBUG, "%s: unknown discriminant %s\n", registry_name, netwire_key_text(key).c_str());
    return NetStatusUnknownDiscriminant;
  }
  ASSURE(variant != 0, NetStatusFailed);
  return NetStatusOk;
}

NetStatus NetWireTaggedRecord::select_variant(const std::string &key)
{
  NetWireVariant *created;
  PROPAGATE_NETSTATUS(registry->create(key, created));
  delete variant;
  variant = created;
  return NetStatusOk;
}

NetStatus NetWireTaggedRecord::variant_discriminant(std::string &key) const
{
  if (!variant)
  {
    diag_printf_fn(DIAG_DEBUG, "%s: no variant assigned\n", registry->name());
    return NetStatusBadCallParms;
  }
  key = variant->discriminant_key();
  return NetStatusOk;
}

NetStatus NetWireTaggedRecord::encode(NetStreamOutputBuffer &StreamBuffer)
{
  if (!variant)
  {
    diag_printf_fn(DIAG_DEBUG, "%s: encode with no variant assigned\n", registry->name());
    return NetStatusBadCallParms;
  }
  return variant->encode(StreamBuffer);
}

// With an embedded discriminant the variant is chosen here from the leading bytes,
// otherwise the field table has already selected it from the sibling fields.
NetStatus NetWireTaggedRecord::decode(NetStreamInputBuffer &StreamBuffer)
{
  if (embedded_key_width)
  {
    std::vector<byte> key_bytes(embedded_key_width);
    PROPAGATE_NETSTATUS(StreamBuffer.peek_input(&key_bytes[0], embedded_key_width));
    PROPAGATE_NETSTATUS(select_variant(netwire_key(&key_bytes[0], embedded_key_width)));
  }
  if (!variant)
  {
    diag_printf_fn(DIAG_DEBUG, "%s: decode with no variant selected\n", registry->name());
    return NetStatusBadCallParms;
  }
  return variant->decode(StreamBuffer);
}
