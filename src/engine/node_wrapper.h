// The host headers use deprecated v8 calls which blow up with warnings
#pragma once
#ifdef __clang__
#pragma clang system_header
#include <node.h>
#include <uv.h>
#elif __GNUC__
#pragma GCC system_header
#include <node.h>
#include <uv.h>
#else
#include <node.h>
#include <uv.h>
#endif
#include <v8.h>
