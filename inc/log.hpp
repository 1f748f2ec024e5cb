#ifndef LOG_H
#define LOG_H

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
#else
  // native: same call sites, printed on stderr
  #include <cstdio>
  #define EMSCRIPTEN_KEEPALIVE
  #define EM_LOG_CONSOLE 1
  #define EM_LOG_WARN 2
  #define EM_LOG_ERROR 4
  #define emscripten_log(x, fmt, ...) fprintf(stderr, fmt "\n", ##__VA_ARGS__)
#endif

#endif // LOG_H
