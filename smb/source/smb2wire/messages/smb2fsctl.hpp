//
// smb2fsctl.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  IOCTL input buffers, selected by CtlCode.
//
#ifndef include_smb2fsctl
#define include_smb2fsctl

#include "wireobjects.hpp"
#include "wirefieldtable.hpp"
#include "wiretagged.hpp"

#define FSCTL_VALIDATE_NEGOTIATE_INFO   0x00140204
#define FSCTL_PIPE_TRANSCEIVE           0x0011C017
#define FSCTL_DFS_GET_REFERRALS         0x00060194
#define FSCTL_QUERY_NETWORK_INTERFACE_INFO 0x001401FC

#define SMB2_0_IOCTL_IS_FSCTL           0x00000001

/// Input registry key: CtlCode followed by Flags. Typed inputs are only
/// selected for file system controls, SMB2_0_IOCTL_IS_FSCTL set.
std::string smb2_ioctl_key(dword ctl_code, dword flags);

class NetSmb2IoctlInput : public NetWireVariant {
public:
  virtual dword ctl_code() const = 0;
  std::string discriminant_key() const { return smb2_ioctl_key(ctl_code(), SMB2_0_IOCTL_IS_FSCTL); }
};

class NetSmb2ValidateNegotiateInfoRequest : public NetSmb2IoctlInput {
public:
  NetSmb2ValidateNegotiateInfoRequest() {objectsize=24; }
  NETWIRE_VARIANT(NetSmb2ValidateNegotiateInfoRequest, "FSCTL_VALIDATE_NEGOTIATE_INFO")
  dword ctl_code() const { return FSCTL_VALIDATE_NEGOTIATE_INFO; }
  NetWiredword Capabilities;
  NetWireGuid  Guid;
  NetWireword  SecurityMode;
  NetWireMarker16 DialectCount;
  NetWireArray<NetWireword> Dialects;
protected:
  void BindFields(NetWireFieldTable &T);
};

// Named pipe write and read in one round trip, the input is the pipe payload
class NetSmb2PipeTransceiveRequest : public NetSmb2IoctlInput {
public:
  NETWIRE_VARIANT(NetSmb2PipeTransceiveRequest, "FSCTL_PIPE_TRANSCEIVE")
  dword ctl_code() const { return FSCTL_PIPE_TRANSCEIVE; }
  NetWireblob Data;
  bool wire_empty() const { return Data.wire_empty(); }
protected:
  void BindFields(NetWireFieldTable &T) { BINDPAYLOAD(Data); }
};

const NetWireVariantRegistry &smb2_ioctl_input_registry();

#endif // include_smb2fsctl
