#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// HexiLink - ETL Deterministic Profile
// Containers are statically sized, no exceptions and no RTTI. The host build
// still links the standard thread library, so the STL is left available.

#define ETL_NO_EXCEPTIONS
#define ETL_NO_RTTI
#define ETL_CHECK_PUSH_POP

#endif
