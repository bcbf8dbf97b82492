//
// smb2utils.cpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Diagnostics, status names and string conversion helpers shared by the codec.
//

#include <cstdarg>
#include <cstdio>

#include "smb2defs.hpp"
#include "smb2diagnostics.hpp"

static smb_diaglevel global_diag_level = (smb_diaglevel) SMB2WIRE_CFG_DIAG_LEVEL;

void smb2wire_set_diag_level(smb_diaglevel level) { global_diag_level = level; }
smb_diaglevel smb2wire_get_diag_level() { return global_diag_level; }

void diag_dump_bin_fn(smb_diaglevel at_diaglayer,  const char *prompt, const void *buffer, int size)
{
  smb_diagnostics d;
  d.diag_dump_bin(at_diaglayer, prompt, buffer, size);
}

void diag_dump_unicode_fn(smb_diaglevel at_diaglayer,  const char *prompt, const void *buffer, int size)
{
  smb_diagnostics d;
  d.diag_dump_unicode(at_diaglayer, prompt, (const byte *)buffer, size);
}

void diag_printf_fn(smb_diaglevel at_diaglayer, const char* fmt...)
{
  if (!global_diag_level || global_diag_level < at_diaglayer)
    return;
  char buffer[512];
  va_list args;
  va_start(args, fmt);
  vsnprintf (buffer, sizeof(buffer), fmt, args);
  va_end(args);
  cout << buffer;
}

const char *smb2wire_status_string(NetStatus status)
{
  switch (status)
  {
    case NetStatusOk                  : return "NetStatusOk";
    case NetStatusFailed              : return "NetStatusFailed";
    case NetStatusFull                : return "NetStatusFull";
    case NetStatusEmpty               : return "NetStatusEmpty";
    case NetStatusBadCallParms        : return "NetStatusBadCallParms";
    case NetStatusStructuralViolation : return "NetStatusStructuralViolation";
    case NetStatusAlignmentViolation  : return "NetStatusAlignmentViolation";
    case NetStatusBoundsViolation     : return "NetStatusBoundsViolation";
    case NetStatusUnknownDiscriminant : return "NetStatusUnknownDiscriminant";
    case NetStatusEncodingOverflow    : return "NetStatusEncodingOverflow";
    case NetStatusUnresolvedMarker    : return "NetStatusUnresolvedMarker";
  }
  return "NetStatusUnknown";
}

void smb2wire_util_ascii_to_unicode (const char *ascii_string, std::vector<word> &unicode_string)
{
  unicode_string.clear();
  while (*ascii_string)
    unicode_string.push_back((word)(byte)*ascii_string++);
}

// Code units above 0xff are replaced with '?'
std::string smb2wire_util_unicode_to_ascii (const std::vector<word> &unicode_string)
{
  std::string r;
  for (size_t i = 0; i < unicode_string.size(); i++)
    r += unicode_string[i] <= 0xff ? (char) unicode_string[i] : '?';
  return r;
}

void smb2wire_dump_bytes(const char *prompt, const void *_pbytes, int length, int format)
{
int i;
int charno = 0;
const byte *pbytes = (const byte *) _pbytes;
    printf("%-40s:(%4d) bytes:\n", prompt, length);
    for (i=0; i<length; i++)
    {
      if (format==DUMPBIN)
      {
          printf("%2.2X ", pbytes[i]);
          if (++charno == 16)
          {
            charno = 0;
            printf("\n");
          }
      }
      else
      {
        printf("%c", (char) pbytes[i]);
        if (format==DUMPUNICODE)
          i++;
      }
    }
    printf("\n===\n");
}
