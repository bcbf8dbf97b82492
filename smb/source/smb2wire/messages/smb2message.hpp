//
// smb2message.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  One SMB2 message, header plus body. The header is at stream position 0 so
//  every absolute offset in the body is measured from it.
//
#ifndef include_smb2message
#define include_smb2message

#include "smb2wireobjects.hpp"
#include "smb1negotiate.hpp"

/// Command -> request body
const NetWireVariantRegistry &smb2_request_registry();
/// Command -> successful response body
const NetWireVariantRegistry &smb2_response_registry();
/// Any command -> NetSmb2ErrorReply
const NetWireVariantRegistry &smb2_error_registry();

class NetSmb2PlainMessage : public NetWireRecord {
public:
  NetSmb2PlainMessage() : Body(smb2_request_registry()) {}
  NetSmb2Header Header;
  NetWireTaggedRecord Body;

  /// Takes ownership. Header.Command is taken from the body when the message is encoded.
  void set_body(NetWireVariant *body) { Body.assign(body); }
  template <class C> C *body_as() const { return Body.variant_as<C>(); }
  /// Responses with a failure status carry NetSmb2ErrorReply instead of the command's own body.
  /// STATUS_BUFFER_OVERFLOW on READ, IOCTL and QUERY_INFO keeps the command's body.
  bool carries_error_body() const;

  NetStatus encode(NetStreamOutputBuffer &StreamBuffer);
  NetStatus decode(NetStreamInputBuffer &StreamBuffer);
private:
  const NetWireVariantRegistry &body_registry() const;
};

NetStatus smb2wire_encode_message(NetSmb2PlainMessage &msg, std::vector<byte> &out);
/// Encode into caller storage, NetStatusFull when it does not fit.
NetStatus smb2wire_encode_message(NetSmb2PlainMessage &msg, byte *buffer, dword buffer_size, dword &bytes_used);
/// An SMB1 negotiate fails the ProtocolId check, see smb2wire_is_smb1_message.
NetStatus smb2wire_decode_message(const byte *bytes, dword length, NetSmb2PlainMessage &msg);

#endif // include_smb2message
