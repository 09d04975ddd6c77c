/*
Module Name:
- attributes.hpp

Abstract:
- Portable spellings for the branch hints used by drop_miner.
- Keeps compiler specific syntax out of the engine and adapter sources.

Provided Macros:
- DM_LIKELY(x), DM_UNLIKELY(x)

Notes:
- Hints guide code generation only.
*/
#pragma once

// DM_LIKELY / DM_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define DM_LIKELY(x) (__builtin_expect(!!(x), 1))
#define DM_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define DM_LIKELY(x) (x)
#define DM_UNLIKELY(x) (x)
#endif
