//
// wiretagged.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Tagged records. The body layout is selected by a discriminant that is either
//  a sibling field decoded earlier (context type, ctl code, info class ..) or a
//  few bytes at the start of the body itself.
//
//  Discriminants are keyed by their wire bytes, so u16 codes, u32 codes, four
//  character context names and GUID names all share one registry type.
//
#ifndef include_wiretagged
#define include_wiretagged

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"

std::string netwire_key(byte value);
std::string netwire_key(word value);
std::string netwire_key(dword value);
std::string netwire_key(const char *name);
std::string netwire_key(const byte *key_bytes, dword size);
std::string netwire_key_text(const std::string &key);

/// One concrete body layout of a tagged record.
class NetWireVariant : public NetWireStruct {
public:
  virtual std::string discriminant_key() const = 0;
  virtual NetWireVariant *Clone() const = 0;
  virtual const char *variant_name() const = 0;
  const char *command_name() { return variant_name(); }
};

// Clone() and variant_name() for a concrete variant class
#define NETWIRE_VARIANT(C, NAME) \
  NetWireVariant *Clone() const { return new C(*this); } \
  const char *variant_name() const { return NAME; }

typedef NetWireVariant *(*NetWireVariantFactory)(const std::string &key);

template <class V>
NetWireVariant *netwire_make_variant(const std::string &key) { (void) key; return new V(); }

/// Keeps the discriminant and the body as raw bytes.
class NetWireOpaqueVariant : public NetWireVariant {
public:
  NetWireOpaqueVariant() {}
  NetWireOpaqueVariant(const std::string &_key) { key = _key; }
  NETWIRE_VARIANT(NetWireOpaqueVariant, "Opaque")
  NetWireblob Data;
  std::string discriminant_key() const { return key; }
  bool wire_empty() const { return Data.wire_empty(); }
protected:
  void BindFields(NetWireFieldTable &T) { BINDPAYLOAD(Data); }
private:
  std::string key;
};

NetWireVariant *netwire_make_opaque_variant(const std::string &key);

/// Discriminant to factory table. Built once, read only afterwards.
class NetWireVariantRegistry {
public:
  NetWireVariantRegistry(const char *_registry_name) { registry_name=_registry_name; fallback=0; }
  NetWireVariantRegistry &add(const std::string &key, NetWireVariantFactory factory) { table[key] = factory; return *this; }
  NetWireVariantRegistry &set_fallback(NetWireVariantFactory factory) { fallback = factory; return *this; }
  bool known(const std::string &key) const { return table.find(key) != table.end(); }
  /// Returns NetStatusUnknownDiscriminant for unregistered keys when there is no fallback.
  NetStatus create(const std::string &key, NetWireVariant *&variant) const;
  const char *name() const { return registry_name; }
private:
  const char *registry_name;
  std::map<std::string, NetWireVariantFactory> table;
  NetWireVariantFactory fallback;
};

/// Interface the field table driver uses to move discriminants in and out of a tagged payload.
class NetWireTaggedBase : public NetWireRecord {
public:
  virtual NetStatus select_variant(const std::string &key) = 0;
  virtual NetStatus variant_discriminant(std::string &key) const = 0;
};

/// Owns one variant, created from the registry on decode or assigned by the caller on encode.
class NetWireTaggedRecord : public NetWireTaggedBase {
public:
  NetWireTaggedRecord(const NetWireVariantRegistry &_registry, dword _embedded_key_width=0)
    : registry(&_registry) { embedded_key_width=_embedded_key_width; variant=0; }
  NetWireTaggedRecord(const NetWireTaggedRecord &other)
    : registry(other.registry) { embedded_key_width=other.embedded_key_width; variant = other.variant ? other.variant->Clone() : 0; }
  NetWireTaggedRecord &operator=(const NetWireTaggedRecord &other)
  {
    if (this != &other)
    {
      NetWireVariant *copy = other.variant ? other.variant->Clone() : 0;
      delete variant;
      variant = copy;
      registry = other.registry;
      embedded_key_width = other.embedded_key_width;
    }
    return *this;
  }
  ~NetWireTaggedRecord() { delete variant; }

  /// Takes ownership.
  void assign(NetWireVariant *_variant) { delete variant; variant = _variant; }
  NetWireVariant *operator()() const { return variant; }
  template <class V> V *variant_as() const { return dynamic_cast<V *>(variant); }
  bool has_variant() const { return variant != 0; }

  NetStatus select_variant(const std::string &key);
  NetStatus variant_discriminant(std::string &key) const;
  NetStatus encode(NetStreamOutputBuffer &StreamBuffer);
  NetStatus decode(NetStreamInputBuffer &StreamBuffer);
  bool wire_empty() const { return !variant || variant->wire_empty(); }
  void wire_clear() { delete variant; variant = 0; }
private:
  const NetWireVariantRegistry *registry;
  dword embedded_key_width;
  NetWireVariant *variant;
};

#endif // include_wiretagged
