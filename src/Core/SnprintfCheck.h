#pragma once
/**
 * @file SnprintfCheck.h
 * @brief snprintf wrapper that reports truncation with the call site.
 */

#include "Core/Log.h"
#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>

static inline int wakeSnprintfChecked_(const char* tag,
                                       const char* file,
                                       int line,
                                       char* out,
                                       size_t outLen,
                                       const char* fmt,
                                       ...)
{
    va_list ap;
    va_start(ap, fmt);
    const int wrote = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);

    if ((wrote < 0) || (outLen == 0) || ((size_t)wrote >= outLen)) {
        Log::warn(tag ? tag : "FmtChk",
                  "snprintf truncated at %s:%d (cap=%u need=%d)",
                  file ? file : "?",
                  line,
                  (unsigned)outLen,
                  wrote);
    }
    return wrote;
}

#define WAKE_SNPRINTF_CHECKED(TAG, OUT, LEN, FMT, ...) \
    wakeSnprintfChecked_((TAG), __FILE__, __LINE__, (OUT), (LEN), (FMT), ##__VA_ARGS__)
