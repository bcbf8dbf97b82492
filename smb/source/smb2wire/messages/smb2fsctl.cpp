//
// smb2fsctl.cpp -
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

#include "smb2fsctl.hpp"

void NetSmb2ValidateNegotiateInfoRequest::BindFields(NetWireFieldTable &T)
{
  BINDFIELD(Capabilities);
  BINDFIELD(Guid);
  BINDFIELD(SecurityMode);
  BINDCOUNT(DialectCount, Dialects);
  BINDPAYLOAD(Dialects);
}

std::string smb2_ioctl_key(dword ctl_code, dword flags)
{
  return netwire_key(ctl_code) + netwire_key(flags);
}

static NetWireVariantRegistry build_ioctl_input_registry()
{
  NetWireVariantRegistry r("SMB2_IOCTL input");
  r.add(smb2_ioctl_key(FSCTL_VALIDATE_NEGOTIATE_INFO, SMB2_0_IOCTL_IS_FSCTL), netwire_make_variant<NetSmb2ValidateNegotiateInfoRequest>)
   .add(smb2_ioctl_key(FSCTL_PIPE_TRANSCEIVE, SMB2_0_IOCTL_IS_FSCTL),         netwire_make_variant<NetSmb2PipeTransceiveRequest>)
   .set_fallback(netwire_make_opaque_variant);
  return r;
}

const NetWireVariantRegistry &smb2_ioctl_input_registry()
{
  static const NetWireVariantRegistry registry = build_ioctl_input_registry();
  return registry;
}
