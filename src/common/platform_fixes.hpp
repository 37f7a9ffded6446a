// windows.h 定义的宏会与 LogLevel 枚举值冲突，统一在此处理。
// 本文件可以重复包含：在 <windows.h> 之后再次包含即可清除冲突的宏。

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#ifdef ERROR
#undef ERROR
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef DEBUG
#undef DEBUG
#endif
#ifdef FATAL
#undef FATAL
#endif
#ifdef TRACE
#undef TRACE
#endif
