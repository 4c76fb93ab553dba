#include "query_compiler.h"
#include "filter_vocabulary.h"
#include "utilities.h"

#include <exception>
#include <string>
#include <vector>

// ============================================================================
// Query Compiler
// ============================================================================

QueryCompiler::QueryCompiler(const size_t page_size)
        : page_size_(page_size == 0 ? 1 : page_size)
{}

[[nodiscard]] size_t QueryCompiler::page_size() const
{
	return page_size_;
}

[[nodiscard]] Result<CompiledQuery> QueryCompiler::compile(const std::string_view raw,
                                                           const size_t page_index) const
{
	try {
		return compile_words(raw, page_index);
	} catch (const std::exception& e) {
		return Error{ErrorKind::Internal,
		             std::string("query compilation failed: ") + e.what()};
	}
}

[[nodiscard]] Result<CompiledQuery> QueryCompiler::compile_words(const std::string_view raw,
                                                                 const size_t page_index) const
{
	std::vector<std::string> text    = {};
	std::vector<std::string> filters = {};
	std::vector<std::string> sorts   = {};

	for (auto& word : Util::split_words(raw)) {
		if (word.starts_with('+') || word.starts_with('-')) {
			filters.emplace_back(std::move(word));
		} else if (word.starts_with('/')) {
			sorts.emplace_back(std::move(word));
		} else {
			text.emplace_back(std::move(word));
		}
	}

	CompiledQuery query = {.term       = Util::join(text, " "),
	                       .page_index = page_index,
	                       .page_size  = page_size_};

	if (sorts.size() > 1) {
		return Error{ErrorKind::UserInput,
		             "more than one sorting rule: " + Util::join(sorts, " ")};
	}
	if (!sorts.empty()) {
		const std::string_view name = std::string_view(sorts.front()).substr(1);
		query.sort                  = Vocabulary::parse_sort_rule(name);
		if (!query.sort) {
			return Error{ErrorKind::UserInput,
			             "invalid sorting rule \"" + std::string(name) +
			                     "\" (valid rules: relevance, downloads, follows, newest, updated)"};
		}
	}

	// One OR-group per category, exclusions appended after them
	FilterGroups groups(Vocabulary::CategoryCount);

	for (const auto& filter : filters) {
		const auto clause = Vocabulary::resolve(filter);
		if (!clause) {
			return Error{ErrorKind::UserInput,
			             "invalid search filter \"" + filter + "\""};
		}

		const auto category = Vocabulary::category_of(filter);
		if (const auto* error = error_of(category)) {
			return *error;
		}

		if (filter.starts_with('+')) {
			groups[static_cast<size_t>(std::get<Vocabulary::Category>(category))]
			        .push_back(*clause);
		} else {
			groups.push_back({*clause});
		}
	}

	std::erase_if(groups, [](const auto& group) { return group.empty(); });
	query.groups = std::move(groups);

	return query;
}
