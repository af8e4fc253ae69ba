// awkls/sema/function_checker.hpp - Call existence and argument count checks
#pragma once

namespace awkls
{

class Document;

/**
 * Check every call site recorded in `doc`.
 *
 * Replaces the document's analysis diagnostics. Functions are looked up in
 * the document, then in its include closure, then among the built-ins.
 * Reports:
 *   - a function defined both in `doc` and in one of its includes
 *   - calls to undeclared functions (one per call site)
 *   - calls with too few or too many arguments
 */
void check_function_calls(Document & doc);

}  // namespace awkls
