///// Otter: BULB_CUDA_CHECK - log the failing expression with the CUDA error string, then throw.
///// Schneefuchs: Only CUDA TUs include this; the plain logger header stays toolkit-free.
///// Maus: ASCII-only; no stderr side-effects; std::runtime_error carries the expression text.
///// Datei: src/cuda_check.hpp

#pragma once

#include <cuda_runtime.h>    // cudaError_t, cudaGetErrorString
#include <stdexcept>

#include "bulb_log.hpp"

#ifndef BULB_CUDA_CHECK
#define BULB_CUDA_CHECK(expr)                                                      \
    do {                                                                           \
        cudaError_t err__ = (expr);                                                \
        if (err__ != cudaSuccess) {                                                \
            const char* _msg = ::cudaGetErrorString(err__);                        \
            if (!_msg) _msg = "<cudaGetErrorString=null>";                         \
            BULB_LOG_HOST("[CUDA ERROR] %s failed -> %s", #expr, _msg);            \
            throw std::runtime_error("CUDA failure: " #expr);                      \
        }                                                                          \
    } while (0)
#endif
