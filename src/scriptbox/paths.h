#ifndef SCRIPTBOX_PATHS_H_
#define SCRIPTBOX_PATHS_H_

#include <string>
#include <scriptbox/paths.h>
#include <scriptbox/execution.h>

// mkdtemp template for a new workspace of the given execution
std::string WorkspaceTemplate(long execution_id);
// inside a workspace
fs::path WorkspaceScript(const fs::path& workspace, Interpreter lang);
fs::path WorkspaceRunner(const fs::path& workspace, Interpreter lang); // empty if none

#endif  // SCRIPTBOX_PATHS_H_
