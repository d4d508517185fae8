#ifndef SCRIPTBOX_LAUNCHER_H_
#define SCRIPTBOX_LAUNCHER_H_

#include <string>

#include <scriptbox/params.h>
#include <scriptbox/workspace.h>
#include "sandbox.h"
#include "utils.h"

// Content of the workspace's runner file; nullptr if the interpreter runs the
//   script directly
const char* RunnerScript(Interpreter);

// kInterpreterPath if set, otherwise the first executable match of the
//   interpreter's program name in the server's PATH
bool ResolveInterpreter(Interpreter, fs::path& out);

// Fill command, envs, workdir, input and limits for running the staged script
//   of ws. The script is always a separate argv element and parameters never
//   pass through a command line. False if the interpreter cannot be resolved.
bool BuildLaunchOptions(const Workspace& ws, const EncodedArguments& args,
                        int timeout_seconds, SandboxOptions& opt, std::string& error);

#endif  // SCRIPTBOX_LAUNCHER_H_
