//
// smb2defs.hpp -
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

#ifndef include_smb2defs
#define include_smb2defs

#include <algorithm>
#include <climits>
#include <map>
#include <iostream>
#include <string>
#include <cstddef>
#include <cstring>
#include <vector>
#include <stdint.h>

#include "smb2wireconf.hpp"

#define tc_memcpy memcpy
#define tc_memcmp memcmp
#define tc_memset memset

using std::cout;
using std::endl;

// Log levels for further processing by cout_log()
#define LL_JUNK  0
#define LL_TESTS 1
#define LL_INIT  2
// Macro for now but convert to a class for a better outcome
#define cout_log(level) cout

#define DUMPBIN     0
#define DUMPASCII   1
#define DUMPUNICODE 2
extern void smb2wire_dump_bytes(const char *prompt, const void *pbytes, int length, int format);

typedef uint8_t   byte;   //8-bit
typedef uint16_t  word;   //16-bit
typedef uint32_t  dword;  //32-bit
typedef uint64_t  ddword; //64-bit

#define LARGEST_STRING 255

#define TURN_ON(A, B)	{(A) |= (B);}
/* if A is false, return B */
#define ASSURE(A, B)    {if (!(A))	return B;}
/* if A is not NetStatusOk, return it */
#define PROPAGATE_NETSTATUS(A) {NetStatus _propagated_status = (A); if (_propagated_status != NetStatusOk) return _propagated_status;}

/// Propogate status conditions up from the lowest failure level with these constants
enum NetStatus {
    NetStatusOk                   = 0,
    NetStatusFailed               = -1,
    NetStatusFull                 = -2,
    NetStatusEmpty                = -3,
    NetStatusBadCallParms         = -6,
    NetStatusStructuralViolation  = -20,  // Reserved, constant or structure size field did not match
    NetStatusAlignmentViolation   = -21,  // Offset not a multiple of its required alignment
    NetStatusBoundsViolation      = -22,  // Seek or read outside the buffer or a bounded region
    NetStatusUnknownDiscriminant  = -23,  // Tagged record discriminant not registered and no fallback
    NetStatusEncodingOverflow     = -24,  // Value does not fit the width of its wire field
    NetStatusUnresolvedMarker     = -25,  // Placeholder left unpatched when a structure finished encoding
};

extern const char *smb2wire_status_string(NetStatus status);

typedef enum smb_diaglevel_e {
    DIAG_DISABLED      =0,
    DIAG_CONSOLE       =1,
    DIAG_JUNK          =1,             // Handy for bumping diagnostics.
    DIAG_INFORMATIONAL =2,
    DIAG_DEBUG         =3,
} smb_diaglevel;
extern void smb2wire_set_diag_level(smb_diaglevel level);
extern smb_diaglevel smb2wire_get_diag_level();
extern void diag_dump_bin_fn(smb_diaglevel at_diaglayer,  const char *prompt, const void *buffer, int size);
extern void diag_dump_unicode_fn(smb_diaglevel at_diaglayer,  const char *prompt, const void *buffer, int size);
extern void diag_printf_fn(smb_diaglevel at_diaglayer, const char* fmt...);

extern void smb2wire_util_ascii_to_unicode (const char *ascii_string, std::vector<word> &unicode_string);
extern std::string smb2wire_util_unicode_to_ascii (const std::vector<word> &unicode_string);

#endif // include_smb2defs
