//
// smb2wireconf.hpp -
//
// EBS - RTSMB
//
// Copyright EBS Inc. , 2018
// All rights reserved.
// This code may not be redistributed in source or linkable object form
// without the consent of its author.
//
// Module description:
//  Compile time configuration for the SMB2 wire codec. Every value may be
//  overridden on the compiler command line.
//
#ifndef include_smb2wireconf
#define include_smb2wireconf

// Initial diagnostic threshold. 0 is DIAG_DISABLED, 3 is DIAG_DEBUG.
#ifndef SMB2WIRE_CFG_DIAG_LEVEL
#define SMB2WIRE_CFG_DIAG_LEVEL            0
#endif

// 1 makes the padding reader fail with NetStatusStructuralViolation on non zero pad bytes.
#ifndef SMB2WIRE_CFG_VERIFY_PADDING
#define SMB2WIRE_CFG_VERIFY_PADDING        0
#endif

// Upper bound on the number of records walked in a single chained list.
#ifndef SMB2WIRE_CFG_MAX_CHAINED_ITEMS
#define SMB2WIRE_CFG_MAX_CHAINED_ITEMS     4096
#endif

// Upper bound on a counted array (dialects, locks, negotiate contexts..)
#ifndef SMB2WIRE_CFG_MAX_ARRAY_ELEMENTS
#define SMB2WIRE_CFG_MAX_ARRAY_ELEMENTS    65535
#endif

// Largest buffer a growable NetStreamOutputBuffer will allocate.
#ifndef SMB2WIRE_CFG_MAX_BUFFER_SIZE
#define SMB2WIRE_CFG_MAX_BUFFER_SIZE       (8*1024*1024)
#endif

#endif // include_smb2wireconf
