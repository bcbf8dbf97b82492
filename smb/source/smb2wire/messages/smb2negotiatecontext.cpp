//
// smb2negotiatecontext.cpp -
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

#include "smb2negotiatecontext.hpp"

void NetSmb2PreauthIntegrityCapabilities::BindFields(NetWireFieldTable &T)
{
  BINDCOUNT(HashAlgorithmCount, HashAlgorithms);
  BINDMARKER(SaltLength);
  BINDPAYLOAD(HashAlgorithms);
  BINDPAYLOAD(Salt).sized_by(SaltLength);
}

void NetSmb2EncryptionCapabilities::BindFields(NetWireFieldTable &T)
{
  BINDCOUNT(CipherCount, Ciphers);
  BINDPAYLOAD(Ciphers);
}

void NetSmb2CompressionCapabilities::BindFields(NetWireFieldTable &T)
{
  BINDCOUNT(CompressionAlgorithmCount, CompressionAlgorithms);
  BINDRESERVED(Padding);
  BINDFIELD(Flags);
  BINDPAYLOAD(CompressionAlgorithms);
}

void NetSmb2RdmaTransformCapabilities::BindFields(NetWireFieldTable &T)
{
  BINDCOUNT(TransformCount, RdmaTransformIds);
  BINDRESERVED(Reserved1);
  BINDRESERVED(Reserved2);
  BINDPAYLOAD(RdmaTransformIds);
}

void NetSmb2SigningCapabilities::BindFields(NetWireFieldTable &T)
{
  BINDCOUNT(SigningAlgorithmCount, SigningAlgorithms);
  BINDPAYLOAD(SigningAlgorithms);
}

void NetSmb2NegotiateContext::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(ContextType);
  BINDMARKER(DataLength);
  BINDRESERVED(Reserved);
  BINDPAYLOAD(Data).sized_by(DataLength).tagged_by(ContextType);
}

void NetSmb2NegotiateContext::show_contents()
{
  NetWireVariant *v = Data();
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_NEGOTIATE_CONTEXT type: %d length: %d %s\n", ContextType(), (int) DataLength(), v ? v->variant_name() : "");
}

static NetWireVariantRegistry build_negotiate_context_registry()
{
  NetWireVariantRegistry r("SMB2 negotiate context");
  r.add(netwire_key((word)SMB2_PREAUTH_INTEGRITY_CAPABILITIES), netwire_make_variant<NetSmb2PreauthIntegrityCapabilities>)
   .add(netwire_key((word)SMB2_ENCRYPTION_CAPABILITIES),        netwire_make_variant<NetSmb2EncryptionCapabilities>)
   .add(netwire_key((word)SMB2_COMPRESSION_CAPABILITIES),       netwire_make_variant<NetSmb2CompressionCapabilities>)
   .add(netwire_key((word)SMB2_NETNAME_NEGOTIATE_CONTEXT_ID),   netwire_make_variant<NetSmb2NetnameNegotiateContextId>)
   .add(netwire_key((word)SMB2_TRANSPORT_CAPABILITIES),         netwire_make_variant<NetSmb2TransportCapabilities>)
   .add(netwire_key((word)SMB2_RDMA_TRANSFORM_CAPABILITIES),    netwire_make_variant<NetSmb2RdmaTransformCapabilities>)
   .add(netwire_key((word)SMB2_SIGNING_CAPABILITIES),           netwire_make_variant<NetSmb2SigningCapabilities>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

const NetWireVariantRegistry &smb2_negotiate_context_registry()
{
  static const NetWireVariantRegistry registry = build_negotiate_context_registry();
  return registry;
}
