//
// smb2createcontext.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Create context layouts and the name to layout tables.
//

#include "smb2createcontext.hpp"

const byte SMB2_CREATE_APP_INSTANCE_ID[16]      = {0x45,0xBC,0xA6,0x6A,0xEF,0xA7,0xF7,0x4A,0x90,0x08,0xFA,0x46,0x2E,0x14,0x4D,0x74};
const byte SMB2_CREATE_APP_INSTANCE_VERSION[16] = {0xB9,0x82,0xD0,0xB7,0x3B,0x56,0x07,0x4F,0xA0,0x7B,0x52,0x4A,0x81,0x16,0xA0,0x10};
const byte SVHDX_OPEN_DEVICE_CONTEXT[16]        = {0x9C,0xCB,0xCF,0x9E,0x04,0xC1,0xE6,0x43,0x98,0x0E,0x15,0x8D,0xA1,0xF6,0xEC,0x83};

void NetSmb2RequestLease::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(LeaseKey);
  BINDFIELD(LeaseState);
  BINDFIELD(LeaseFlags);
  BINDRESERVED(LeaseDuration);
  if (version2)
  {
    BINDFIELD(ParentLeaseKey);
    BINDFIELD(Epoch);
    BINDRESERVED(Reserved);
  }
}

void NetSmb2AppInstanceVersion::BindFields(NetWireFieldTable &T)
{
  BINDCONSTANT(StructureSize, 24);
  BINDRESERVED(Reserved);
  BINDRESERVED(Reserved2);
  BINDFIELD(AppInstanceVersionHigh);
  BINDFIELD(AppInstanceVersionLow);
}

void NetSvhdxOpenDeviceContextV1::BindFields(NetWireFieldTable &T)
{
  (void) T.constant(Version, device_version(), "Version");
  BINDFIELD(HasInitiatorId);
  BINDRESERVED(Reserved1);
  BINDRESERVED(Reserved2);
  BINDFIELD(InitiatorId);
  BINDFIELD(Flags);
  BINDFIELD(OriginatorFlags);
  BINDFIELD(OpenRequestId);
  BINDFIELD(InitiatorHostNameLength);
  BINDFIELD(InitiatorHostName);
}

void NetSvhdxOpenDeviceContextV2::BindFields(NetWireFieldTable &T)
{
  NetSvhdxOpenDeviceContextV1::BindFields(T);
  BINDFIELD(VirtualDiskPropertiesInitialized);
  BINDFIELD(ServerServiceVersion);
  BINDFIELD(VirtualSectorSize);
  BINDFIELD(PhysicalSectorSize);
  BINDFIELD(VirtualSize);
}

// Name and data offsets count from the start of the entry, 4 bytes before NameOffset
void NetSmb2CreateContext::BindFields(NetWireFieldTable &T)
{
  NetWireAnchor EntryStart = NetWireAnchor::marker_position(NameOffset, -4);
  BINDMARKER(NameOffset);
  BINDMARKER(NameLength);
  BINDRESERVED(Reserved);
  BINDMARKER(DataOffset);
  BINDMARKER(DataLength);
  BINDPAYLOAD(Name).aligned(8).at_offset(NameOffset, EntryStart).sized_by(NameLength);
  BINDPAYLOAD(Data).aligned(8).at_offset(DataOffset, EntryStart).offset_must_align(8).sized_by(DataLength).tagged_by(Name);
}

void NetSmb2CreateContext::show_contents()
{
  NetWireVariant *v = Data();
  diag_printf_fn(DIAG_INFORMATIONAL,"SMB2_CREATE_CONTEXT name: %s data length: %d %s\n",
                 netwire_key_text(name()).c_str(), (int) DataLength(), v ? v->variant_name() : "");
}

static NetWireVariantRegistry build_svhdx_version_registry()
{
  NetWireVariantRegistry r("SVHDX_OPEN_DEVICE_CONTEXT version");
  r.add(netwire_key((dword)1), netwire_make_variant<NetSvhdxOpenDeviceContextV1>)
   .add(netwire_key((dword)2), netwire_make_variant<NetSvhdxOpenDeviceContextV2>);
  return r;
}

const NetWireVariantRegistry &smb2_svhdx_version_registry()
{
  static const NetWireVariantRegistry registry = build_svhdx_version_registry();
  return registry;
}

// SecD and unregistered names keep their data as opaque bytes
static NetWireVariantRegistry build_create_request_context_registry()
{
  NetWireVariantRegistry r("SMB2_CREATE request context");
  r.add(netwire_key(SMB2_CREATE_EA_BUFFER),                    netwire_make_variant<NetSmb2CreateEaBuffer>)
   .add(netwire_key(SMB2_CREATE_DURABLE_HANDLE_REQUEST),       netwire_make_variant<NetSmb2DurableHandleRequest>)
   .add(netwire_key(SMB2_CREATE_DURABLE_HANDLE_RECONNECT),     netwire_make_variant<NetSmb2DurableHandleReconnect>)
   .add(netwire_key(SMB2_CREATE_ALLOCATION_SIZE),              netwire_make_variant<NetSmb2AllocationSize>)
   .add(netwire_key(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST), netwire_make_variant<NetSmb2QueryMaximalAccessRequest>)
   .add(netwire_key(SMB2_CREATE_TIMEWARP_TOKEN),               netwire_make_variant<NetSmb2TimewarpToken>)
   .add(netwire_key(SMB2_CREATE_QUERY_ON_DISK_ID),             netwire_make_variant<NetSmb2QueryOnDiskIdRequest>)
   .add(netwire_key(SMB2_CREATE_REQUEST_LEASE),                netwire_make_variant<NetSmb2RequestLease>)
   .add(netwire_key(SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2),    netwire_make_variant<NetSmb2DurableHandleRequestV2>)
   .add(netwire_key(SMB2_CREATE_DURABLE_HANDLE_RECONNECT_V2),  netwire_make_variant<NetSmb2DurableHandleReconnectV2>)
   .add(netwire_key(SMB2_CREATE_APP_INSTANCE_ID, 16),          netwire_make_variant<NetSmb2AppInstanceId>)
   .add(netwire_key(SMB2_CREATE_APP_INSTANCE_VERSION, 16),     netwire_make_variant<NetSmb2AppInstanceVersion>)
   .add(netwire_key(SVHDX_OPEN_DEVICE_CONTEXT, 16),            netwire_make_variant<NetSmb2SvhdxOpenDevice>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

static NetWireVariantRegistry build_create_response_context_registry()
{
  NetWireVariantRegistry r("SMB2_CREATE response context");
  r.add(netwire_key(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST), netwire_make_variant<NetSmb2QueryMaximalAccessResponse>)
   .add(netwire_key(SMB2_CREATE_QUERY_ON_DISK_ID),             netwire_make_variant<NetSmb2QueryOnDiskIdResponse>)
   .add(netwire_key(SMB2_CREATE_DURABLE_HANDLE_REQUEST),       netwire_make_variant<NetSmb2DurableHandleResponse>)
   .add(netwire_key(SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2),    netwire_make_variant<NetSmb2DurableHandleResponseV2>)
   .add(netwire_key(SMB2_CREATE_REQUEST_LEASE),                netwire_make_variant<NetSmb2RequestLease>)
   .add(netwire_key(SMB2_CREATE_APP_INSTANCE_ID, 16),          netwire_make_variant<NetSmb2AppInstanceId>)
   .add(netwire_key(SMB2_CREATE_APP_INSTANCE_VERSION, 16),     netwire_make_variant<NetSmb2AppInstanceVersion>)
   .add(netwire_key(SVHDX_OPEN_DEVICE_CONTEXT, 16),            netwire_make_variant<NetSmb2SvhdxOpenDevice>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

const NetWireVariantRegistry &smb2_create_request_context_registry()
{
  static const NetWireVariantRegistry registry = build_create_request_context_registry();
  return registry;
}

const NetWireVariantRegistry &smb2_create_response_context_registry()
{
  static const NetWireVariantRegistry registry = build_create_response_context_registry();
  return registry;
}
