#ifndef QUERY_COMPILER_H
#define QUERY_COMPILER_H

#include "error_t.h"
#include "query_t.h"

#include <string_view>

// ============================================================================
// Query Compiler
// ============================================================================

// Turns "foo bar +mod -dp +v1.20.1 /downloads" into a CompiledQuery.
//
// Words starting with '+' or '-' are filters, a word starting with '/' is
// the sort rule, everything else is free text. Inclusive filters of one
// category are ORed together; every exclusive filter becomes its own
// AND-only group.
class QueryCompiler {
	size_t page_size_ = 20;

	[[nodiscard]] Result<CompiledQuery> compile_words(const std::string_view raw,
	                                                  const size_t page_index) const;

public:
	explicit QueryCompiler(const size_t page_size);

	[[nodiscard]] Result<CompiledQuery> compile(const std::string_view raw,
	                                            const size_t page_index = 0) const;

	[[nodiscard]] size_t page_size() const;
};

#endif
