#ifndef HOSTGATE_PLUGIN_H
#define HOSTGATE_PLUGIN_H

/*
 * C ABI implemented by extension packages (.so / .dylib) placed in the extensions directory.
 * All exported strings stay owned by the package; results of hostgate_tool_execute are
 * released with hostgate_tool_result_free.
 */

#define HOSTGATE_PLUGIN_ABI_VERSION 1

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
  const char *name;
  const char *version;
} HostGateExtensionInfo;

typedef struct {
  const char *name;
  const char *description;
  /* JSON schema object: "properties" and "required" are read. */
  const char *parameters_json;
} HostGateToolSpec;

typedef struct {
  char *output;
  char *error;
  int success;
  int truncated;
} HostGateToolResult;

/* Returns non-zero once the host has cancelled the call. */
typedef int (*HostGateCancelFn)(void *cancel_ctx);

int hostgate_plugin_abi_version(void);
const HostGateExtensionInfo *hostgate_extension_info(void);
/* 0 on success. */
int hostgate_extension_init(void);
int hostgate_tool_count(void);
const HostGateToolSpec *hostgate_tool_spec(int index);
HostGateToolResult *hostgate_tool_execute(const char *tool_name, const char *args_json,
                                          HostGateCancelFn is_cancelled, void *cancel_ctx);
void hostgate_tool_result_free(HostGateToolResult *result);

typedef int (*hostgate_plugin_abi_version_fn)(void);
typedef const HostGateExtensionInfo *(*hostgate_extension_info_fn)(void);
typedef int (*hostgate_extension_init_fn)(void);
typedef int (*hostgate_tool_count_fn)(void);
typedef const HostGateToolSpec *(*hostgate_tool_spec_fn)(int);
typedef HostGateToolResult *(*hostgate_tool_execute_fn)(const char *, const char *,
                                                        HostGateCancelFn, void *);
typedef void (*hostgate_tool_result_free_fn)(HostGateToolResult *);

#ifdef __cplusplus
}
#endif

#endif
