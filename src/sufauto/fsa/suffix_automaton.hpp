#pragma once

#include "sam_state_arena.hpp"
#include <terark/fstring.hpp>
#include <stdio.h>
#include <type_traits>

namespace sufauto {

using terark::byte_t;
using terark::fstring;

/// env SufAuto_debugLevel, 0 is silent
SUFAUTO_DLL_EXPORT long SamDebugLevel();

/// env SufAuto_verifyOnFinalize, run verify() in every finalize()
SUFAUTO_DLL_EXPORT bool SamVerifyOnFinalize();

template<class Symbol, class Ch>
inline Symbol sam_symbol_cast(Ch c, std::true_type) {
	// char may be signed, map it to [0, 256)
	return Symbol(typename std::make_unsigned<Ch>::type(c));
}
template<class Symbol, class Ch>
inline Symbol sam_symbol_cast(const Ch& c, std::false_type) {
	return Symbol(c);
}
template<class Symbol, class Ch>
inline Symbol sam_symbol_cast(const Ch& c) {
	return sam_symbol_cast<Symbol>(c, std::is_integral<Ch>());
}

/// Online suffix automaton: the minimal DFA of all substrings of the text
/// consumed so far by extend().
///
/// Two phases:
///  - mutable: extend() appends symbols, contains_substring(),
///    count_distinct_substrings(), occurrence_count() are available,
///    but nothing may run concurrently with extend()
///  - frozen : entered by finalize(), terminal states are marked and
///    is_suffix() is available, all const methods are thread safe,
///    extend() throws std::logic_error until unfreeze()
///
/// The root (initial_state) is terminal after finalize(), so the empty
/// string is reported as a suffix.
template<class Symbol = byte_t, class StateID = uint32_t>
class SuffixAutomaton {
public:
	typedef SamStateArena<Symbol, StateID> arena_t;
	typedef typename arena_t::state_t      state_t;
	typedef typename arena_t::move_t       move_t;
	typedef StateID                        state_id_t;
	typedef Symbol                         symbol_t;
	static constexpr state_id_t nil_state = arena_t::nil_state;
	static constexpr state_id_t initial_state = 0;

protected:
	arena_t    m_arena;
	state_id_t m_last;
	bool       m_frozen;

	// endpos set size of each state, lazily built when mutable
	mutable bool           m_cnt_valid;
	mutable valvec<size_t> m_endpos_cnt;

	void compute_endpos_cnt() const;

	template<class Ch>
	state_id_t walk(const Ch* p, size_t n, size_t* matched) const {
		state_id_t s = initial_state;
		size_t i = 0;
		for (; i < n; ++i) {
			state_id_t t = m_arena.state_move(s, sam_symbol_cast<Symbol>(p[i]));
			if (nil_state == t)
				break;
			s = t;
		}
		if (matched)
			*matched = i;
		return i == n ? s : nil_state;
	}

public:
	SuffixAutomaton();

	/// back to the automaton of the empty text, mutable
	void erase_all();

	void extend(Symbol c);

	template<class Ch>
	void extend(const Ch* p, size_t n) {
		for (size_t i = 0; i < n; ++i)
			extend(sam_symbol_cast<Symbol>(p[i]));
	}
	void extend(fstring s) { extend(s.udata(), s.size()); }

	void finalize();
	void unfreeze();
	bool is_frozen() const { return m_frozen; }

	template<class Ch>
	bool contains_substring(const Ch* p, size_t n) const {
		return nil_state != walk(p, n, NULL);
	}
	bool contains_substring(fstring s) const {
		return contains_substring(s.udata(), s.size());
	}

	/// throws std::logic_error if not frozen
	template<class Ch>
	bool is_suffix(const Ch* p, size_t n) const {
		if (terark_unlikely(!m_frozen)) {
			THROW_STD(logic_error,
				"is_suffix requires finalize(), text_length=%zd",
				text_length());
		}
		state_id_t s = walk(p, n, NULL);
		return nil_state != s && m_arena[s].b_term;
	}
	bool is_suffix(fstring s) const { return is_suffix(s.udata(), s.size()); }

	/// number of end positions of the pattern in the text, 0 if not found
	template<class Ch>
	size_t occurrence_count(const Ch* p, size_t n) const {
		state_id_t s = walk(p, n, NULL);
		if (nil_state == s)
			return 0;
		if (!m_cnt_valid) {
			assert(!m_frozen);
			compute_endpos_cnt();
		}
		return m_endpos_cnt[s];
	}
	size_t occurrence_count(fstring s) const {
		return occurrence_count(s.udata(), s.size());
	}

	/// length of the longest prefix of pattern which is a substring of text
	template<class Ch>
	size_t match_prefix_length(const Ch* p, size_t n) const {
		size_t matched = 0;
		walk(p, n, &matched);
		return matched;
	}
	size_t match_prefix_length(fstring s) const {
		return match_prefix_length(s.udata(), s.size());
	}

	size_t count_distinct_substrings() const;

	size_t text_length() const { return m_arena[m_last].len; }
	size_t total_states() const { return m_arena.total_states(); }
	size_t total_transitions() const { return m_arena.total_transitions(); }
	size_t mem_size() const;
	state_id_t last_state() const { return m_last; }
	const arena_t& arena() const { return m_arena; }

	/// check all structural invariants, throws std::logic_error on failure
	void verify() const;

	/// Symbol must be integral
	void print_states(FILE* fp) const;
};

extern template class SuffixAutomaton<byte_t, uint32_t>;
extern template class SuffixAutomaton<byte_t, uint64_t>;
extern template class SuffixAutomaton<uint32_t, uint32_t>;

typedef SuffixAutomaton<byte_t, uint32_t>   ByteSuffixAutomaton;
typedef SuffixAutomaton<uint32_t, uint32_t> WideSuffixAutomaton;

} // namespace sufauto
