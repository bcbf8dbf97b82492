//
// wireobjects.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Wire primitives and the structure base class. Every wire object implements
//  the NetWireRecord encode/decode pair so primitives, nested structures, lists
//  and tagged records can be mixed freely inside a structure's field table.
//
#ifndef include_wireobjects
#define include_wireobjects

#include "smb2defs.hpp"
#include "netstreambuffer.hpp"

// Little endian load/store, independent of host byte order
inline void netwire_store_le(byte *raw_address, ddword v, int width)
{
  for (int i = 0; i < width; i++) { raw_address[i] = (byte)(v & 0xff); v >>= 8; }
}
inline ddword netwire_load_le(const byte *raw_address, int width)
{
  ddword v = 0;
  for (int i = width-1; i >= 0; i--) v = (v << 8) | raw_address[i];
  return v;
}

#define HTONETWORD(D)   netwire_store_le(raw_address, (D), 2)
#define NETTOHWORD(D)   D = (word)netwire_load_le(raw_address, 2)
#define HTONETDWORD(D)  netwire_store_le(raw_address, (D), 4)
#define NETTOHDWORD(D)  D = (dword)netwire_load_le(raw_address, 4)
#define HTONETDDWORD(D) netwire_store_le(raw_address, (D), 8)
#define NETTOHDDWORD(D) D = (ddword)netwire_load_le(raw_address, 8)

#define NETWIRE_MAX_FIXED_SIZE 128

/// Anything that can be written to and read back from the wire.
class NetWireRecord {
public:
  virtual ~NetWireRecord() {}
  virtual NetStatus encode(NetStreamOutputBuffer &StreamBuffer) = 0;
  virtual NetStatus decode(NetStreamInputBuffer &StreamBuffer) = 0;
  /// True when the record contributes no bytes. Optional payloads are skipped when empty.
  virtual bool wire_empty() const { return false; }
  /// Called instead of decode when an optional payload is absent from the wire.
  virtual void wire_clear() {}
};

// base class for all fixed width network primitives
class NetWire : public NetWireRecord {
  public:
    NetWire() { blob_size = 0; }
    int wire_size() const { return blob_size; }
    NetStatus encode(NetStreamOutputBuffer &StreamBuffer)
    {
      byte raw_address[NETWIRE_MAX_FIXED_SIZE];
      to_wire(raw_address);
      return StreamBuffer.push_to_buffer(raw_address, blob_size);
    }
    NetStatus decode(NetStreamInputBuffer &StreamBuffer)
    {
      byte raw_address[NETWIRE_MAX_FIXED_SIZE];
      PROPAGATE_NETSTATUS(StreamBuffer.pull_input(raw_address, blob_size));
      from_wire(raw_address);
      return NetStatusOk;
    }
protected:
   int blob_size;
   virtual void to_wire(byte *raw_address) const = 0;
   virtual void from_wire(const byte *raw_address) = 0;
};

//  Smart classes that inheret from NetWire
//   () returns the value, or a pointer to the bytes for blobs.
//   = is overloaded for assignment to  NetWirebyte MyVar = 1;
//  class NetWirebyte
//  class NetWireword
//  class NetWiredword
//  class NetWireddword
//  class NetWireFileTime
//  class NetWireblob4 / 8 / 16 / 24
//  class NetWireFileId
//  class NetWireGuid
//  class NetWireblob   (variable length)

class NetWirebyte  : public NetWire {
  public:
    NetWirebyte() {blob_size=1; rv=0;}
    NetWirebyte(byte d) {blob_size=1; rv=d;}
    void operator =(byte d)  { rv=d; }
    byte operator()() const { return rv; }
   private:
    byte rv;
    void to_wire(byte *raw_address) const { raw_address[0] = rv; }
    void from_wire(const byte *raw_address) { rv = raw_address[0]; }
};

class NetWireword  : public NetWire {
  public:
    NetWireword() {blob_size=2; rv=0;}
    NetWireword(word d) {blob_size=2; rv=d;}
    void operator =(word d)  { rv=d; }
    word operator()() const { return rv; }
   private:
    word rv;
    void to_wire(byte *raw_address) const { HTONETWORD(rv); }
    void from_wire(const byte *raw_address) { NETTOHWORD(rv); }
};

class NetWiredword  : public NetWire {
  public:
    NetWiredword() {blob_size=4; rv=0;}
    NetWiredword(dword d) {blob_size=4; rv=d;}
    void operator =(dword d)  { rv=d; }
    dword operator()() const { return rv; }
   private:
    dword rv;
    void to_wire(byte *raw_address) const { HTONETDWORD(rv); }
    void from_wire(const byte *raw_address) { NETTOHDWORD(rv); }
};

class NetWireddword  : public NetWire {
  public:
    NetWireddword() {blob_size=8; rv=0;}
    NetWireddword(ddword d) {blob_size=8; rv=d;}
    void operator =(ddword d)  { rv=d; }
    ddword operator()() const { return rv; }
   private:
    ddword rv;
    void to_wire(byte *raw_address) const { HTONETDDWORD(rv); }
    void from_wire(const byte *raw_address) { NETTOHDDWORD(rv); }
};

// 100ns intervals since 1601, as FILETIME
class NetWireFileTime  : public NetWireddword {
  public:
    NetWireFileTime() {}
    void operator =(ddword d)  { NetWireddword::operator=(d); }
};

template <int N>
class NetWireFixedBlob  : public NetWire {
  public:
    NetWireFixedBlob() { blob_size=N; tc_memset(rv, 0, N); }
    void operator =(const byte *s)  { tc_memcpy(rv, s, N); }
    const byte *operator()() const { return rv; }
    void get(void *p) const { tc_memcpy(p, rv, N); }
    bool operator ==(const NetWireFixedBlob<N> &other) const { return tc_memcmp(rv, other.rv, N) == 0; }
   private:
    byte rv[N];
    void to_wire(byte *raw_address) const { tc_memcpy(raw_address, rv, N); }
    void from_wire(const byte *raw_address) { tc_memcpy(rv, raw_address, N); }
};

class NetWireblob4  : public NetWireFixedBlob<4>  { public: void operator =(const byte *s) { NetWireFixedBlob<4>::operator=(s); } };
class NetWireblob8  : public NetWireFixedBlob<8>  { public: void operator =(const byte *s) { NetWireFixedBlob<8>::operator=(s); } };
class NetWireblob16 : public NetWireFixedBlob<16> { public: void operator =(const byte *s) { NetWireFixedBlob<16>::operator=(s); } };
class NetWireblob24 : public NetWireFixedBlob<24> { public: void operator =(const byte *s) { NetWireFixedBlob<24>::operator=(s); } };

// GUIDs are carried as their 16 wire bytes
class NetWireGuid   : public NetWireFixedBlob<16> { public: void operator =(const byte *s) { NetWireFixedBlob<16>::operator=(s); } };

// Persistent and volatile halves of an SMB2_FILEID
class NetWireFileId  : public NetWireFixedBlob<16> {
  public:
    void operator =(const byte *s)  { NetWireFixedBlob<16>::operator=(s); }
    ddword persistent_id() const { return netwire_load_le((*this)(), 8); }
    ddword volatile_id() const   { return netwire_load_le((*this)()+8, 8); }
    void set_ids(ddword persistent, ddword volatile_id)
    {
      byte raw_address[16];
      netwire_store_le(raw_address, persistent, 8);
      netwire_store_le(raw_address+8, volatile_id, 8);
      NetWireFixedBlob<16>::operator=(raw_address);
    }
};

/// Variable length byte buffer. Decoding consumes everything left in the current region,
/// so it is normally reached through a length marker.
class NetWireblob  : public NetWireRecord {
  public:
    NetWireblob() {}
    NetWireblob(const byte *s, dword size) { assign(s, size); }
    void assign(const byte *s, dword size) { bytes.assign(s, s+size); }
    void operator =(const std::vector<byte> &s) { bytes = s; }
    const std::vector<byte> &operator()() const { return bytes; }
    dword size() const { return (dword) bytes.size(); }
    bool operator ==(const NetWireblob &other) const { return bytes == other.bytes; }
    NetStatus encode(NetStreamOutputBuffer &StreamBuffer) { return bytes.empty() ? NetStatusOk : StreamBuffer.push_to_buffer(&bytes[0], (dword)bytes.size()); }
    NetStatus decode(NetStreamInputBuffer &StreamBuffer)
    {
      bytes.resize(StreamBuffer.bytes_remaining());
      return bytes.empty() ? NetStatusOk : StreamBuffer.pull_input(&bytes[0], (dword)bytes.size());
    }
    bool wire_empty() const { return bytes.empty(); }
    void wire_clear() { bytes.clear(); }
  private:
    std::vector<byte> bytes;
};

class NetWireFieldTable;

// Field table shorthands, used inside BindFields(NetWireFieldTable &T)
#define BINDFIELD(O)        (void) T.field(O, #O)
#define BINDCONSTANT(O, V)  (void) T.constant(O, V, #O)
#define BINDRESERVED(O)     T.reserved(O, #O)
#define BINDMARKER(O)       (void) T.marker(O, #O)
#define BINDCOUNT(O, L)     (void) T.count(O, L, #O)
#define BINDALIGN(B)        (void) T.align(B)
#define BINDPAYLOAD(O)      T.payload(O, #O)

// base class for all network structures build from primitives
// Derived classes list their fields in BindFields(), the generic field table driver does the rest.
class NetWireStruct : public NetWireRecord  {
public:
  NetWireStruct() { objectsize = 0; }
  virtual ~NetWireStruct() {}
  NetStatus encode(NetStreamOutputBuffer &StreamBuffer);
  NetStatus decode(NetStreamInputBuffer &StreamBuffer);
  virtual const char *command_name() { return "NetWireStruct"; }
  virtual int  FixedStructureSize()  { return (int)objectsize; }
  virtual void show_contents() {}
protected:
  virtual void BindFields(NetWireFieldTable &T) = 0;
  /// Derive computed fields before the field table runs
  virtual NetStatus PrepareEncode() { return NetStatusOk; }
  /// Cross field checks after a successful decode
  virtual NetStatus ValidateDecoded() { return NetStatusOk; }
  dword objectsize;
};

#endif // include_wireobjects
