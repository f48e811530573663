#include <remex/payload.h>

#include <regex>

#include <httplib.h>
#include <remex/errors.h>

namespace {

const char kEntrypointHead[] = R"(import asyncio
import base64
import inspect
import json
import os
import sys
import traceback
import typing

sys.path.insert(0, os.getcwd())


def __remex_write(doc):
    fd = os.environ.get("REMEX_IPC_FD")
    path = os.environ.get("REMEX_RESULT_FILE")
    if fd:
        with os.fdopen(int(fd), "w") as f:
            f.write(doc)
    elif path:
        with open(path, "w") as f:
            f.write(doc)
    else:
        print("Error: neither REMEX_IPC_FD nor REMEX_RESULT_FILE is set", file=sys.stderr)
        sys.exit(1)


def __remex_coerce(func, arg):
    try:
        hints = typing.get_type_hints(func)
    except Exception:
        return arg
    params = list(inspect.signature(func).parameters)
    if not params:
        return arg
    model = hints.get(params[0])
    if hasattr(model, "model_validate"):
        return model.model_validate(arg)
    return arg


async def __remex_await(value):
    return await value


def __remex_main():
    try:
)";

const char kEntrypointTail[] = R"(        res = func(__remex_coerce(func, arg))
        if inspect.isawaitable(res):
            res = asyncio.run(__remex_await(res))
        if hasattr(res, "model_dump_json"):
            doc = res.model_dump_json()
        else:
            doc = json.dumps(res)
    except Exception as e:
        traceback.print_exc()
        __remex_write(json.dumps({
            "__remote_execution_error__": True,
            "error_type": type(e).__name__,
            "error_message": str(e),
        }))
        sys.exit(1)
    __remex_write(doc)


if __name__ == "__main__":
    __remex_main()
)";

bool IsImportPath(const std::string& str) {
  static const std::regex kPattern(R"([A-Za-z_][A-Za-z0-9_]*(\.[A-Za-z_][A-Za-z0-9_]*)*)");
  return std::regex_match(str, kPattern);
}

} // namespace

std::string PythonPayloadGenerator::Generate(const WorkItem& work) const {
  if (!IsImportPath(work.module)) {
    throw ConfigurationError("Invalid module path '" + work.module + "'");
  }
  if (!IsImportPath(work.function) || work.function.find('.') != std::string::npos) {
    throw ConfigurationError("Invalid function name '" + work.function + "'");
  }
  std::string arg;
  try {
    arg = httplib::detail::base64_encode(
        work.argument.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict));
  } catch (const nlohmann::json::type_error& e) {
    throw ConfigurationError(std::string("Argument is not serializable: ") + e.what());
  }
  std::string ret = kEntrypointHead;
  ret += "        from " + work.module + " import " + work.function + " as func\n";
  ret += "        arg = json.loads(base64.b64decode(\"" + arg + "\").decode(\"utf-8\"))\n";
  ret += kEntrypointTail;
  return ret;
}
