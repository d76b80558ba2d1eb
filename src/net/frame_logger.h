#pragma once
#include <spdlog/spdlog.h>

// Per-datagram tracing, compiled in only with -DSTIGMESH_NET_TRACE.
#ifdef STIGMESH_NET_TRACE
  #define NET_TRACE(...) spdlog::trace(__VA_ARGS__)
#else
  #define NET_TRACE(...) (void)0
#endif
