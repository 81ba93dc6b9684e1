// rapter/codegen/runtime_helpers.cpp - C runtime support emitted into every unit
//
#include "rapter/codegen/runtime_helpers.hpp"

namespace rapter::runtime
{

namespace
{

constexpr std::string_view k_headers = R"(#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stddef.h>
#include <ctype.h>
)";

constexpr std::string_view k_primitive_dynamic_arrays =
  R"(typedef struct { int* data; size_t size; size_t capacity; } DynamicArray_int;
typedef struct { double* data; size_t size; size_t capacity; } DynamicArray_double;
typedef struct { char* data; size_t size; size_t capacity; } DynamicArray_char;
typedef struct { char** data; size_t size; size_t capacity; } DynamicArray_charptr;
)";

constexpr std::string_view k_helper_functions = R"(static int __rapter_argc = 0;
static char** __rapter_argv = NULL;

static inline int rapter_get_argc(void) { return __rapter_argc; }

static inline char* rapter_get_argv(int i) {
    return (i >= 0 && i < __rapter_argc) ? __rapter_argv[i] : "";
}

static inline char* rapter_substring(char* str, int start, int end) {
    if (!str) return NULL;
    int len = (int)strlen(str);
    if (start < 0) start = 0;
    if (end > len) end = len;
    if (start >= end) return strdup("");
    int sublen = end - start;
    char* result = (char*)malloc((size_t)sublen + 1);
    if (!result) return NULL;
    memcpy(result, str + start, (size_t)sublen);
    result[sublen] = 0;
    return result;
}

static inline char* rapter_trim(char* str) {
    if (!str) return NULL;
    while (*str && isspace((unsigned char)*str)) str++;
    if (!*str) return strdup("");
    char* end = str + strlen(str) - 1;
    while (end > str && isspace((unsigned char)*end)) end--;
    size_t len = (size_t)(end - str) + 1;
    char* result = (char*)malloc(len + 1);
    if (!result) return NULL;
    memcpy(result, str, len);
    result[len] = 0;
    return result;
}

static inline DynamicArray_charptr rapter_split(char* str, char* delim) {
    DynamicArray_charptr arr = { NULL, 0, 0 };
    if (!str || !delim) return arr;
    char* copy = strdup(str);
    if (!copy) return arr;
    for (char* token = strtok(copy, delim); token; token = strtok(NULL, delim)) {
        if (arr.size == arr.capacity) {
            arr.capacity = arr.capacity ? arr.capacity * 2 : 4;
            arr.data = (char**)realloc(arr.data, arr.capacity * sizeof(char*));
        }
        arr.data[arr.size++] = strdup(token);
    }
    free(copy);
    return arr;
}

static inline int rapter_contains(char* str, char* needle) {
    return str && needle && strstr(str, needle) != NULL;
}

static inline char* rapter_concat(char* a, char* b) {
    size_t la = a ? strlen(a) : 0;
    size_t lb = b ? strlen(b) : 0;
    char* result = (char*)malloc(la + lb + 1);
    if (!result) return NULL;
    if (la) memcpy(result, a, la);
    if (lb) memcpy(result + la, b, lb);
    result[la + lb] = 0;
    return result;
}

static inline size_t rapter_pop_index(size_t* size) {
    if (*size == 0) {
        fprintf(stderr, "runtime error: pop from an empty DynamicArray\n");
        exit(1);
    }
    return --*size;
}

static inline char* rapter_read_all(char* path) {
    FILE* f = fopen(path, "rb");
    if (!f) return strdup("");
    if (fseek(f, 0, SEEK_END) != 0) { fclose(f); return strdup(""); }
    long sz = ftell(f);
    if (sz < 0) { fclose(f); return strdup(""); }
    fseek(f, 0, SEEK_SET);
    char* buf = (char*)malloc((size_t)sz + 1);
    if (!buf) { fclose(f); return NULL; }
    size_t n = fread(buf, 1, (size_t)sz, f);
    fclose(f);
    buf[n] = 0;
    return buf;
}

static inline int rapter_write_all(char* path, char* data) {
    FILE* f = fopen(path, "wb");
    if (!f) return -1;
    size_t n = strlen(data);
    size_t w = fwrite(data, 1, n, f);
    fclose(f);
    return w == n ? 0 : -1;
}
)";

}  // namespace

std::string_view headers()
{
  return k_headers;
}

std::string_view primitive_dynamic_arrays()
{
  return k_primitive_dynamic_arrays;
}

std::string_view helper_functions()
{
  return k_helper_functions;
}

}  // namespace rapter::runtime
