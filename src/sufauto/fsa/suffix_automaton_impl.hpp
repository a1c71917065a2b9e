#pragma once

#include "suffix_automaton.hpp"
#include <boost/current_function.hpp>

namespace sufauto {

template<class Symbol, class StateID>
SuffixAutomaton<Symbol, StateID>::SuffixAutomaton() {
	m_arena.new_state(0); // initial_state
	m_last = initial_state;
	m_frozen = false;
	m_cnt_valid = false;
}

template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::erase_all() {
	m_arena.erase_all();
	m_arena.new_state(0);
	m_last = initial_state;
	m_frozen = false;
	m_cnt_valid = false;
	m_endpos_cnt.erase_all();
}

template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::extend(Symbol c) {
	if (terark_unlikely(m_frozen)) {
		THROW_STD(logic_error,
			"automaton is frozen, call unfreeze() before extend, text_length=%zd",
			text_length());
	}
	// cur and clone must both fit, else nothing is touched
	if (terark_unlikely(m_arena.avail_states() < 2)) {
		THROW_STD(length_error,
			"state arena exhausted: total_states=%zd text_length=%zd",
			total_states(), text_length());
	}
	arena_t& a = m_arena;
	state_id_t cur = a.new_state(size_t(a[m_last].len) + 1);
	state_id_t p = m_last;
	while (nil_state != p && nil_state == a.state_move(p, c)) {
		a.add_move(p, cur, c);
		p = a[p].link;
	}
	if (nil_state == p) {
		a[cur].link = initial_state;
	}
	else {
		state_id_t q = a.state_move(p, c);
		assert(nil_state != q);
		if (size_t(a[p].len) + 1 == a[q].len) {
			a[cur].link = q;
		}
		else {
			// q's class is too long to be the parent of cur, split it
			state_id_t clone = a.clone_state(q, size_t(a[p].len) + 1);
			while (nil_state != p && a.state_move(p, c) == q) {
				a.set_move(p, clone, c);
				p = a[p].link;
			}
			a[q].link = clone;
			a[cur].link = clone;
			if (SamDebugLevel() >= 2) {
				fprintf(stderr, "DEBUG: %s: clone=%zd of q=%zd len=%zd, cur=%zd\n"
					, BOOST_CURRENT_FUNCTION
					, size_t(clone), size_t(q), size_t(a[clone].len), size_t(cur));
			}
		}
	}
	m_last = cur;
	m_cnt_valid = false;
	if (SamDebugLevel() >= 3) {
		fprintf(stderr, "DEBUG: %s: text_length=%zd states=%zd transitions=%zd\n"
			, BOOST_CURRENT_FUNCTION
			, text_length(), total_states(), total_transitions());
	}
}

template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::finalize() {
	for (state_id_t p = m_last; nil_state != p; p = m_arena[p].link)
		m_arena[p].b_term = 1;
	if (!m_cnt_valid)
		compute_endpos_cnt();
	m_frozen = true;
	if (SamVerifyOnFinalize())
		verify();
	if (SamDebugLevel() >= 1) {
		fprintf(stderr, "INFO: %s: text_length=%zd states=%zd transitions=%zd mem_size=%zd\n"
			, BOOST_CURRENT_FUNCTION
			, text_length(), total_states(), total_transitions(), mem_size());
	}
}

template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::unfreeze() {
	size_t n = m_arena.total_states();
	for (size_t i = 0; i < n; ++i)
		m_arena[state_id_t(i)].b_term = 0;
	m_frozen = false;
}

// Bucket states by len, then add each state's count into its link from
// the longest to the shortest, so every child is done before its parent.
template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::compute_endpos_cnt() const {
	const arena_t& a = m_arena;
	size_t n = a.total_states();
	size_t maxlen = text_length();
	valvec<size_t> index(maxlen + 2, 0);
	for (size_t i = 0; i < n; ++i)
		index[a[state_id_t(i)].len + 1]++;
	for (size_t i = 2; i < index.size(); ++i)
		index[i] += index[i-1];
	valvec<state_id_t> order;
	order.resize_no_init(n);
	for (size_t i = 0; i < n; ++i)
		order[index[a[state_id_t(i)].len]++] = state_id_t(i);
	assert(initial_state == order[0]);

	m_endpos_cnt.resize_no_init(n);
	for (size_t i = 0; i < n; ++i) {
		const state_t& s = a[state_id_t(i)];
		m_endpos_cnt[i] = (initial_state != i && !s.b_clone) ? 1 : 0;
	}
	for (size_t i = n; i > 1; --i) {
		state_id_t s = order[i-1];
		m_endpos_cnt[a[s].link] += m_endpos_cnt[s];
	}
	m_cnt_valid = true;
}

template<class Symbol, class StateID>
size_t SuffixAutomaton<Symbol, StateID>::count_distinct_substrings() const {
	const arena_t& a = m_arena;
	size_t n = a.total_states();
	size_t sum = 0;
	for (size_t i = 1; i < n; ++i) {
		const state_t& s = a[state_id_t(i)];
		sum += s.len - a[s.link].len;
	}
	return sum;
}

template<class Symbol, class StateID>
size_t SuffixAutomaton<Symbol, StateID>::mem_size() const {
	return m_arena.mem_size() + sizeof(size_t) * m_endpos_cnt.capacity();
}

template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::verify() const {
	const arena_t& a = m_arena;
	size_t n = a.total_states();
	if (0 == n)
		THROW_STD(logic_error, "missing initial_state");
	const state_t& root = a[initial_state];
	if (root.len != 0 || root.link != nil_state || root.b_clone)
		THROW_STD(logic_error, "bad initial_state: len=%zd link=%zd clone=%d"
			, size_t(root.len), size_t(root.link), int(root.b_clone));
	if (m_last >= n)
		THROW_STD(logic_error, "last=%zd out of range %zd", size_t(m_last), n);
	size_t textlen = text_length();
	size_t num_extend = 0;
	size_t num_moves = 0;
	for (size_t i = 0; i < n; ++i) {
		const state_t& s = a[state_id_t(i)];
		if (i != initial_state) {
			if (s.link >= n)
				THROW_STD(logic_error, "state %zd: link=%zd out of range %zd"
					, i, size_t(s.link), n);
			if (a[s.link].len >= s.len)
				THROW_STD(logic_error, "state %zd: len=%zd but len(link=%zd)=%zd"
					, i, size_t(s.len), size_t(s.link), size_t(a[s.link].len));
			if (!s.b_clone)
				num_extend++;
		}
		for (size_t j = 0; j < s.moves.size(); ++j) {
			const move_t& m = s.moves[j];
			if (j > 0 && !(s.moves[j-1].ch < m.ch))
				THROW_STD(logic_error, "state %zd: moves not sorted or duplicated at %zd", i, j);
			if (m.target >= n)
				THROW_STD(logic_error, "state %zd: move target=%zd out of range %zd"
					, i, size_t(m.target), n);
			if (a[m.target].len <= s.len)
				THROW_STD(logic_error, "state %zd: len=%zd but move target %zd has len=%zd"
					, i, size_t(s.len), size_t(m.target), size_t(a[m.target].len));
		}
		num_moves += s.moves.size();
	}
	if (num_moves != a.total_transitions())
		THROW_STD(logic_error, "transition_num=%zd but counted %zd"
			, a.total_transitions(), num_moves);
	if (num_extend != textlen)
		THROW_STD(logic_error, "text_length=%zd but %zd non-clone states"
			, textlen, num_extend);
	if (textlen >= 2 && n > 2*textlen - 1)
		THROW_STD(logic_error, "total_states=%zd > 2*%zd-1", n, textlen);
	if (textlen >= 3 && num_moves > 3*textlen - 4)
		THROW_STD(logic_error, "total_transitions=%zd > 3*%zd-4", num_moves, textlen);
	if (m_frozen) {
		valvec<byte_t> on_chain(n, 0);
		for (state_id_t p = m_last; nil_state != p; p = a[p].link)
			on_chain[p] = 1;
		for (size_t i = 0; i < n; ++i) {
			if (on_chain[i] != a[state_id_t(i)].b_term)
				THROW_STD(logic_error, "state %zd: b_term=%d but on_suffix_chain=%d"
					, i, int(a[state_id_t(i)].b_term), int(on_chain[i]));
		}
	}
}

template<class Symbol, class StateID>
void SuffixAutomaton<Symbol, StateID>::print_states(FILE* fp) const {
	const arena_t& a = m_arena;
	size_t n = a.total_states();
	fprintf(fp, "text_length=%zd states=%zd transitions=%zd last=%zd frozen=%d\n"
		, text_length(), n, a.total_transitions(), size_t(m_last), int(m_frozen));
	for (size_t i = 0; i < n; ++i) {
		const state_t& s = a[state_id_t(i)];
		if (initial_state == i)
			fprintf(fp, "%zd: len=0 link=nil", i);
		else
			fprintf(fp, "%zd: len=%zd link=%zd", i, size_t(s.len), size_t(s.link));
		if (s.b_term)  fprintf(fp, " term");
		if (s.b_clone) fprintf(fp, " clone");
		for (const move_t& m : s.moves)
			fprintf(fp, " %llu->%zd", (unsigned long long)(m.ch), size_t(m.target));
		fprintf(fp, "\n");
	}
}

} // namespace sufauto
