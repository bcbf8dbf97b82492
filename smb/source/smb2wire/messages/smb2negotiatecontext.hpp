//
// smb2negotiatecontext.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB 3.1.1 negotiate contexts. Each context is 8 byte aligned inside the
//  NEGOTIATE request or response and selects its data layout by ContextType.
//
#ifndef include_smb2negotiatecontext
#define include_smb2negotiatecontext

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"
#include "wiresizedstring.hpp"
#include "wiretagged.hpp"

#define SMB2_PREAUTH_INTEGRITY_CAPABILITIES     0x0001
#define SMB2_ENCRYPTION_CAPABILITIES            0x0002
#define SMB2_COMPRESSION_CAPABILITIES           0x0003
#define SMB2_NETNAME_NEGOTIATE_CONTEXT_ID       0x0005
#define SMB2_TRANSPORT_CAPABILITIES             0x0006
#define SMB2_RDMA_TRANSFORM_CAPABILITIES        0x0007
#define SMB2_SIGNING_CAPABILITIES               0x0008

#define SMB2_PREAUTH_INTEGRITY_SHA512           0x0001

#define SMB2_ENCRYPTION_AES128_CCM              0x0001
#define SMB2_ENCRYPTION_AES128_GCM              0x0002
#define SMB2_ENCRYPTION_AES256_CCM              0x0003
#define SMB2_ENCRYPTION_AES256_GCM              0x0004

#define SMB2_COMPRESSION_NONE                   0x0000
#define SMB2_COMPRESSION_LZNT1                  0x0001
#define SMB2_COMPRESSION_LZ77                   0x0002
#define SMB2_COMPRESSION_LZ77_HUFFMAN           0x0003
#define SMB2_COMPRESSION_PATTERN_V1             0x0004
#define SMB2_COMPRESSION_LZ4                    0x0005
#define SMB2_COMPRESSION_CAPABILITIES_FLAG_CHAINED 0x00000001

#define SMB2_SIGNING_HMAC_SHA256                0x0000
#define SMB2_SIGNING_AES_CMAC                   0x0001
#define SMB2_SIGNING_AES_GMAC                   0x0002

#define SMB2_RDMA_TRANSFORM_NONE                0x0000
#define SMB2_RDMA_TRANSFORM_ENCRYPTION          0x0001
#define SMB2_RDMA_TRANSFORM_SIGNING             0x0002

#define SMB2_ACCEPT_TRANSPORT_LEVEL_SECURITY    0x00000001

/// Data part of a negotiate context, keyed by its u16 ContextType
class NetSmb2NegotiateContextData : public NetWireVariant {
public:
  virtual word context_type() const = 0;
  std::string discriminant_key() const { return netwire_key(context_type()); }
};

class NetSmb2PreauthIntegrityCapabilities : public NetSmb2NegotiateContextData {
public:
  NetSmb2PreauthIntegrityCapabilities() {objectsize=4; }
  NETWIRE_VARIANT(NetSmb2PreauthIntegrityCapabilities, "SMB2_PREAUTH_INTEGRITY_CAPABILITIES")
  word context_type() const { return SMB2_PREAUTH_INTEGRITY_CAPABILITIES; }
  NetWireMarker16 HashAlgorithmCount;
  NetWireMarker16 SaltLength;
  NetWireArray<NetWireword> HashAlgorithms;
  NetWireblob Salt;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2EncryptionCapabilities : public NetSmb2NegotiateContextData {
public:
  NetSmb2EncryptionCapabilities() {objectsize=2; }
  NETWIRE_VARIANT(NetSmb2EncryptionCapabilities, "SMB2_ENCRYPTION_CAPABILITIES")
  word context_type() const { return SMB2_ENCRYPTION_CAPABILITIES; }
  NetWireMarker16 CipherCount;
  NetWireArray<NetWireword> Ciphers;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2CompressionCapabilities : public NetSmb2NegotiateContextData {
public:
  NetSmb2CompressionCapabilities() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2CompressionCapabilities, "SMB2_COMPRESSION_CAPABILITIES")
  word context_type() const { return SMB2_COMPRESSION_CAPABILITIES; }
  NetWireMarker16 CompressionAlgorithmCount;
  NetWireword  Padding;
  NetWiredword Flags;
  NetWireArray<NetWireword> CompressionAlgorithms;
protected:
  void BindFields(NetWireFieldTable &T);
};

// The server name fills the whole context data
class NetSmb2NetnameNegotiateContextId : public NetSmb2NegotiateContextData {
public:
  NetSmb2NetnameNegotiateContextId() {objectsize=0; }
  NETWIRE_VARIANT(NetSmb2NetnameNegotiateContextId, "SMB2_NETNAME_NEGOTIATE_CONTEXT_ID")
  word context_type() const { return SMB2_NETNAME_NEGOTIATE_CONTEXT_ID; }
  NetWireSizedString NetName;
protected:
  void BindFields(NetWireFieldTable &T) { BINDPAYLOAD(NetName); }
};

class NetSmb2TransportCapabilities : public NetSmb2NegotiateContextData {
public:
  NetSmb2TransportCapabilities() {objectsize=4; }
  NETWIRE_VARIANT(NetSmb2TransportCapabilities, "SMB2_TRANSPORT_CAPABILITIES")
  word context_type() const { return SMB2_TRANSPORT_CAPABILITIES; }
  NetWiredword Flags;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(Flags); }
};

class NetSmb2RdmaTransformCapabilities : public NetSmb2NegotiateContextData {
public:
  NetSmb2RdmaTransformCapabilities() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2RdmaTransformCapabilities, "SMB2_RDMA_TRANSFORM_CAPABILITIES")
  word context_type() const { return SMB2_RDMA_TRANSFORM_CAPABILITIES; }
  NetWireMarker16 TransformCount;
  NetWireword  Reserved1;
  NetWiredword Reserved2;
  NetWireArray<NetWireword> RdmaTransformIds;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2SigningCapabilities : public NetSmb2NegotiateContextData {
public:
  NetSmb2SigningCapabilities() {objectsize=2; }
  NETWIRE_VARIANT(NetSmb2SigningCapabilities, "SMB2_SIGNING_CAPABILITIES")
  word context_type() const { return SMB2_SIGNING_CAPABILITIES; }
  NetWireMarker16 SigningAlgorithmCount;
  NetWireArray<NetWireword> SigningAlgorithms;
protected:
  void BindFields(NetWireFieldTable &T);
};

const NetWireVariantRegistry &smb2_negotiate_context_registry();

class NetSmb2NegotiateContext : public NetWireStruct {
public:
  NetSmb2NegotiateContext() : Data(smb2_negotiate_context_registry()) {objectsize=8; }
  /// Takes ownership of data
  NetSmb2NegotiateContext(NetSmb2NegotiateContextData *data) : Data(smb2_negotiate_context_registry()) {objectsize=8; Data.assign(data); }
  NetWireword  ContextType;
  NetWireMarker16 DataLength;
  NetWiredword Reserved;
  NetWireTaggedRecord Data;
  const char *command_name() { return "SMB2_NEGOTIATE_CONTEXT";}
  template <class V> V *data_as() const { return Data.variant_as<V>(); }
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

typedef NetWireArray<NetSmb2NegotiateContext> NetSmb2NegotiateContextList;

#endif // include_smb2negotiatecontext
