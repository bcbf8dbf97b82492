//
// smb2createcontext.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  SMB2 CREATE contexts. A context is a chained entry holding a name and a
//  data buffer. Both offsets are measured from the start of the entry and the
//  name selects the data layout. Requests and responses use separate tables.
//
#ifndef include_smb2createcontext
#define include_smb2createcontext

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"
#include "wiretagged.hpp"
#include "mswireobjects.hpp"

#define SMB2_CREATE_EA_BUFFER                    "ExtA"
#define SMB2_CREATE_SD_BUFFER                    "SecD"
#define SMB2_CREATE_DURABLE_HANDLE_REQUEST       "DHnQ"
#define SMB2_CREATE_DURABLE_HANDLE_RECONNECT     "DHnC"
#define SMB2_CREATE_ALLOCATION_SIZE              "AlSi"
#define SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST "MxAc"
#define SMB2_CREATE_TIMEWARP_TOKEN               "TWrp"
#define SMB2_CREATE_QUERY_ON_DISK_ID             "QFid"
#define SMB2_CREATE_REQUEST_LEASE                "RqLs"
#define SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2    "DH2Q"
#define SMB2_CREATE_DURABLE_HANDLE_RECONNECT_V2  "DH2C"

// 16 byte GUID names
extern const byte SMB2_CREATE_APP_INSTANCE_ID[16];
extern const byte SMB2_CREATE_APP_INSTANCE_VERSION[16];
extern const byte SVHDX_OPEN_DEVICE_CONTEXT[16];

#define SMB2_LEASE_READ_CACHING                  0x00000001
#define SMB2_LEASE_HANDLE_CACHING                0x00000002
#define SMB2_LEASE_WRITE_CACHING                 0x00000004
#define SMB2_LEASE_FLAG_PARENT_LEASE_KEY_SET     0x00000004
#define SMB2_DHANDLE_FLAG_PERSISTENT             0x00000002

/// Data part of a create context, keyed by the context name bytes
class NetSmb2CreateContextData : public NetWireVariant {
public:
  virtual std::string context_name() const = 0;
  std::string discriminant_key() const { return context_name(); }
};

// Shorthand for the usual 4 character names
#define SMB2_CREATE_CONTEXT_NAME(N) std::string context_name() const { return netwire_key(N); }

class NetSmb2CreateEaBuffer : public NetSmb2CreateContextData {
public:
  NETWIRE_VARIANT(NetSmb2CreateEaBuffer, "SMB2_CREATE_EA_BUFFER")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_EA_BUFFER)
  ms_FILE_FULL_EA_LIST Entries;
protected:
  void BindFields(NetWireFieldTable &T) { BINDPAYLOAD(Entries); }
};

class NetSmb2DurableHandleRequest : public NetSmb2CreateContextData {
public:
  NetSmb2DurableHandleRequest() {objectsize=16; }
  NETWIRE_VARIANT(NetSmb2DurableHandleRequest, "SMB2_CREATE_DURABLE_HANDLE_REQUEST")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_DURABLE_HANDLE_REQUEST)
  NetWireblob16 DurableRequest;
protected:
  void BindFields(NetWireFieldTable &T) { BINDRESERVED(DurableRequest).must_be_zero(); }
};

class NetSmb2DurableHandleResponse : public NetSmb2CreateContextData {
public:
  NetSmb2DurableHandleResponse() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2DurableHandleResponse, "SMB2_CREATE_DURABLE_HANDLE_RESPONSE")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_DURABLE_HANDLE_REQUEST)
  NetWireddword Reserved;
protected:
  void BindFields(NetWireFieldTable &T) { BINDRESERVED(Reserved); }
};

class NetSmb2DurableHandleReconnect : public NetSmb2CreateContextData {
public:
  NetSmb2DurableHandleReconnect() {objectsize=16; }
  NETWIRE_VARIANT(NetSmb2DurableHandleReconnect, "SMB2_CREATE_DURABLE_HANDLE_RECONNECT")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_DURABLE_HANDLE_RECONNECT)
  NetWireFileId FileId;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(FileId); }
};

class NetSmb2AllocationSize : public NetSmb2CreateContextData {
public:
  NetSmb2AllocationSize() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2AllocationSize, "SMB2_CREATE_ALLOCATION_SIZE")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_ALLOCATION_SIZE)
  NetWireddword AllocationSize;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(AllocationSize); }
};

// Timestamp is present only when the context data is not empty
class NetSmb2QueryMaximalAccessRequest : public NetSmb2CreateContextData {
public:
  NetSmb2QueryMaximalAccessRequest() {objectsize=0; has_timestamp=false; }
  NETWIRE_VARIANT(NetSmb2QueryMaximalAccessRequest, "SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST)
  NetWireFileTime Timestamp;
  void set_timestamp(ddword filetime) { Timestamp = filetime; has_timestamp = true; }
  bool timestamp_present() const { return has_timestamp; }
  NetStatus decode(NetStreamInputBuffer &StreamBuffer)
  {
    has_timestamp = StreamBuffer.bytes_remaining() >= 8;
    return NetWireStruct::decode(StreamBuffer);
  }
  bool wire_empty() const { return !has_timestamp; }
protected:
  void BindFields(NetWireFieldTable &T) { if (has_timestamp) BINDFIELD(Timestamp); }
private:
  bool has_timestamp;
};

class NetSmb2QueryMaximalAccessResponse : public NetSmb2CreateContextData {
public:
  NetSmb2QueryMaximalAccessResponse() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2QueryMaximalAccessResponse, "SMB2_CREATE_QUERY_MAXIMAL_ACCESS_RESPONSE")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_QUERY_MAXIMAL_ACCESS_REQUEST)
  NetWiredword QueryStatus;
  NetWiredword MaximalAccess;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(QueryStatus); BINDFIELD(MaximalAccess); }
};

class NetSmb2TimewarpToken : public NetSmb2CreateContextData {
public:
  NetSmb2TimewarpToken() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2TimewarpToken, "SMB2_CREATE_TIMEWARP_TOKEN")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_TIMEWARP_TOKEN)
  NetWireFileTime Timestamp;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(Timestamp); }
};

class NetSmb2QueryOnDiskIdRequest : public NetSmb2CreateContextData {
public:
  NETWIRE_VARIANT(NetSmb2QueryOnDiskIdRequest, "SMB2_CREATE_QUERY_ON_DISK_ID")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_QUERY_ON_DISK_ID)
  bool wire_empty() const { return true; }
protected:
  void BindFields(NetWireFieldTable &T) { (void) T; }
};

class NetSmb2QueryOnDiskIdResponse : public NetSmb2CreateContextData {
public:
  NetSmb2QueryOnDiskIdResponse() {objectsize=32; }
  NETWIRE_VARIANT(NetSmb2QueryOnDiskIdResponse, "SMB2_CREATE_QUERY_ON_DISK_ID_RESPONSE")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_QUERY_ON_DISK_ID)
  NetWireddword DiskFileId;
  NetWireddword VolumeId;
  NetWireblob16 Reserved;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(DiskFileId); BINDFIELD(VolumeId); BINDRESERVED(Reserved); }
};

// Version 1 is 32 bytes, version 2 is 52. The decoder picks by the data size.
class NetSmb2RequestLease : public NetSmb2CreateContextData {
public:
  NetSmb2RequestLease(bool v2=false) { set_version2(v2); }
  NETWIRE_VARIANT(NetSmb2RequestLease, "SMB2_CREATE_REQUEST_LEASE")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_REQUEST_LEASE)
  NetWireblob16 LeaseKey;
  NetWiredword  LeaseState;
  NetWiredword  LeaseFlags;
  NetWireddword LeaseDuration;
  NetWireblob16 ParentLeaseKey;
  NetWireword   Epoch;
  NetWireword   Reserved;
  bool is_version2() const { return version2; }
  void set_version2(bool v2) { version2 = v2; objectsize = v2 ? 52 : 32; }
  NetStatus decode(NetStreamInputBuffer &StreamBuffer)
  {
    set_version2(StreamBuffer.bytes_remaining() >= 52);
    return NetWireStruct::decode(StreamBuffer);
  }
protected:
  void BindFields(NetWireFieldTable &T);
private:
  bool version2;
};

class NetSmb2DurableHandleRequestV2 : public NetSmb2CreateContextData {
public:
  NetSmb2DurableHandleRequestV2() {objectsize=32; }
  NETWIRE_VARIANT(NetSmb2DurableHandleRequestV2, "SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2)
  NetWiredword  Timeout;
  NetWiredword  Flags;
  NetWireddword Reserved;
  NetWireGuid   CreateGuid;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(Timeout); BINDFIELD(Flags); BINDRESERVED(Reserved); BINDFIELD(CreateGuid); }
};

class NetSmb2DurableHandleResponseV2 : public NetSmb2CreateContextData {
public:
  NetSmb2DurableHandleResponseV2() {objectsize=8; }
  NETWIRE_VARIANT(NetSmb2DurableHandleResponseV2, "SMB2_CREATE_DURABLE_HANDLE_RESPONSE_V2")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_DURABLE_HANDLE_REQUEST_V2)
  NetWiredword  Timeout;
  NetWiredword  Flags;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(Timeout); BINDFIELD(Flags); }
};

class NetSmb2DurableHandleReconnectV2 : public NetSmb2CreateContextData {
public:
  NetSmb2DurableHandleReconnectV2() {objectsize=36; }
  NETWIRE_VARIANT(NetSmb2DurableHandleReconnectV2, "SMB2_CREATE_DURABLE_HANDLE_RECONNECT_V2")
  SMB2_CREATE_CONTEXT_NAME(SMB2_CREATE_DURABLE_HANDLE_RECONNECT_V2)
  NetWireFileId FileId;
  NetWireGuid   CreateGuid;
  NetWiredword  Flags;
protected:
  void BindFields(NetWireFieldTable &T) { BINDFIELD(FileId); BINDFIELD(CreateGuid); BINDFIELD(Flags); }
};

class NetSmb2AppInstanceId : public NetSmb2CreateContextData {
public:
  NetSmb2AppInstanceId() {objectsize=20; }
  NETWIRE_VARIANT(NetSmb2AppInstanceId, "SMB2_CREATE_APP_INSTANCE_ID")
  std::string context_name() const { return netwire_key(SMB2_CREATE_APP_INSTANCE_ID, 16); }
  NetWireword  StructureSize;
  NetWireword  Reserved;
  NetWireGuid  AppInstanceId;
protected:
  void BindFields(NetWireFieldTable &T) { BINDCONSTANT(StructureSize, 20); BINDRESERVED(Reserved); BINDFIELD(AppInstanceId); }
};

class NetSmb2AppInstanceVersion : public NetSmb2CreateContextData {
public:
  NetSmb2AppInstanceVersion() {objectsize=24; }
  NETWIRE_VARIANT(NetSmb2AppInstanceVersion, "SMB2_CREATE_APP_INSTANCE_VERSION")
  std::string context_name() const { return netwire_key(SMB2_CREATE_APP_INSTANCE_VERSION, 16); }
  NetWireword   StructureSize;
  NetWireword   Reserved;
  NetWiredword  Reserved2;
  NetWireddword AppInstanceVersionHigh;
  NetWireddword AppInstanceVersionLow;
protected:
  void BindFields(NetWireFieldTable &T);
};

/* MS-RSVD SVHDX_OPEN_DEVICE_CONTEXT, the leading Version selects the layout */
class NetSvhdxOpenDeviceContextV1 : public NetWireVariant {
public:
  NetSvhdxOpenDeviceContextV1() {objectsize=168; }
  NETWIRE_VARIANT(NetSvhdxOpenDeviceContextV1, "SVHDX_OPEN_DEVICE_CONTEXT")
  virtual dword device_version() const { return 1; }
  std::string discriminant_key() const { return netwire_key(device_version()); }
  NetWiredword  Version;
  NetWirebyte   HasInitiatorId;
  NetWirebyte   Reserved1;
  NetWireword   Reserved2;
  NetWireGuid   InitiatorId;
  NetWiredword  Flags;
  NetWiredword  OriginatorFlags;
  NetWireddword OpenRequestId;
  NetWireword   InitiatorHostNameLength;
  NetWireFixedBlob<126> InitiatorHostName;
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSvhdxOpenDeviceContextV2 : public NetSvhdxOpenDeviceContextV1 {
public:
  NetSvhdxOpenDeviceContextV2() {objectsize=192; }
  NETWIRE_VARIANT(NetSvhdxOpenDeviceContextV2, "SVHDX_OPEN_DEVICE_CONTEXT_V2")
  dword device_version() const { return 2; }
  NetWiredword  VirtualDiskPropertiesInitialized;
  NetWiredword  ServerServiceVersion;
  NetWiredword  VirtualSectorSize;
  NetWiredword  PhysicalSectorSize;
  NetWireddword VirtualSize;
protected:
  void BindFields(NetWireFieldTable &T);
};

const NetWireVariantRegistry &smb2_svhdx_version_registry();

class NetSmb2SvhdxOpenDevice : public NetSmb2CreateContextData {
public:
  NetSmb2SvhdxOpenDevice() : Device(smb2_svhdx_version_registry(), 4) {}
  NETWIRE_VARIANT(NetSmb2SvhdxOpenDevice, "SVHDX_OPEN_DEVICE")
  std::string context_name() const { return netwire_key(SVHDX_OPEN_DEVICE_CONTEXT, 16); }
  NetWireTaggedRecord Device;
protected:
  void BindFields(NetWireFieldTable &T) { BINDPAYLOAD(Device); }
};

const NetWireVariantRegistry &smb2_create_request_context_registry();
const NetWireVariantRegistry &smb2_create_response_context_registry();

/// One chained entry. NextEntryOffset is written by the chained list.
class NetSmb2CreateContext : public NetWireStruct {
public:
  NetSmb2CreateContext(const NetWireVariantRegistry &registry) : Data(registry) {objectsize=16; }
  NetWireMarker16 NameOffset;
  NetWireMarker16 NameLength;
  NetWireword     Reserved;
  NetWireMarker16 DataOffset;
  NetWireMarker32 DataLength;
  NetWireblob     Name;
  NetWireTaggedRecord Data;
  const char *command_name() { return "SMB2_CREATE_CONTEXT";}
  std::string name() const { return std::string(Name().begin(), Name().end()); }
  template <class V> V *data_as() const { return Data.variant_as<V>(); }
  void show_contents();
protected:
  void BindFields(NetWireFieldTable &T);
};

class NetSmb2CreateRequestContext : public NetSmb2CreateContext {
public:
  NetSmb2CreateRequestContext() : NetSmb2CreateContext(smb2_create_request_context_registry()) {}
  /// Takes ownership of data
  NetSmb2CreateRequestContext(NetWireVariant *data) : NetSmb2CreateContext(smb2_create_request_context_registry()) { Data.assign(data); }
};

class NetSmb2CreateResponseContext : public NetSmb2CreateContext {
public:
  NetSmb2CreateResponseContext() : NetSmb2CreateContext(smb2_create_response_context_registry()) {}
  /// Takes ownership of data
  NetSmb2CreateResponseContext(NetWireVariant *data) : NetSmb2CreateContext(smb2_create_response_context_registry()) { Data.assign(data); }
};

typedef NetWireChainedList<NetSmb2CreateRequestContext, 8>  NetSmb2CreateRequestContextList;
typedef NetWireChainedList<NetSmb2CreateResponseContext, 8> NetSmb2CreateResponseContextList;

#endif // include_smb2createcontext
