/**
 * @file BackendError.cpp
 * @brief BackendError helpers.
 */

#include "Core/Services/IRegisterBackend.h"

#include <stdarg.h>
#include <stdio.h>

void BackendError::set(ErrorCode c, const char* fmt, ...)
{
    code = c;
    message[0] = '\0';
    if (!fmt) return;
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(message, sizeof(message), fmt, ap);
    va_end(ap);
}

void BackendError::clear()
{
    code = ErrorCode::Ok;
    message[0] = '\0';
}
