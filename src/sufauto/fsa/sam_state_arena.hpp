#pragma once

#include <sufauto/config.hpp>
#include <terark/valvec.hpp>
#include <terark/util/throw.hpp>
#include <boost/static_assert.hpp>
#include <boost/type_traits.hpp>
#include <algorithm>
#include <assert.h>
#include <stdint.h>

namespace sufauto {

using terark::valvec;

template<class Symbol, class StateID>
struct SamMove {
	Symbol  ch;
	StateID target;
	SamMove(Symbol c, StateID t) : ch(c), target(t) {}
};

/// A state of the suffix automaton
///  - len   : length of the longest string in the endpos class
///  - link  : suffix link, nil_state only for the root
///  - moves : sorted by ch, at most one move per ch
template<class Symbol, class StateID>
struct SamState {
	BOOST_STATIC_ASSERT(boost::is_unsigned<StateID>::value);
	enum { LenBits = sizeof(StateID)*8 - 2 };
	static constexpr StateID nil_state = StateID(-1);
	static constexpr StateID max_len = (StateID(1) << LenBits) - 1;

	valvec<SamMove<Symbol, StateID> > moves;
	StateID   link;
	StateID   len     : LenBits;
	unsigned  b_term  : 1; // only meaningful after finalize
	unsigned  b_clone : 1;

	SamState() {
		link = nil_state;
		len = 0;
		b_term = 0;
		b_clone = 0;
	}
};

/// Append-only storage of SamState, addressed by integer id.
/// No state is ever removed, an id returned by new_state/clone_state is
/// valid until erase_all() or destruction of the arena.
template<class Symbol, class StateID = uint32_t>
class SamStateArena {
	BOOST_STATIC_ASSERT(boost::is_pod<Symbol>::value);
public:
	typedef Symbol                    symbol_t;
	typedef StateID                   state_id_t;
	typedef SamMove<Symbol, StateID>  move_t;
	typedef SamState<Symbol, StateID> state_t;
	static constexpr state_id_t nil_state = state_t::nil_state;
	static constexpr state_id_t max_state = state_t::max_len;

protected:
	struct ChLess {
		bool operator()(const move_t& x, Symbol y) const { return x.ch < y; }
		bool operator()(Symbol x, const move_t& y) const { return x < y.ch; }
	};
	valvec<state_t> states;
	size_t transition_num;

public:
	SamStateArena() { transition_num = 0; }

	size_t total_states() const { return states.size(); }
	size_t total_transitions() const { return transition_num; }
	bool   empty() const { return states.empty(); }

	void reserve(size_t n) { states.reserve(n); }
	void erase_all() {
		states.erase_all();
		transition_num = 0;
	}

	/// how many more states can be allocated
	size_t avail_states() const { return size_t(max_state) - states.size(); }

	state_id_t new_state(size_t len) {
		size_t s = states.size();
		if (terark_unlikely(s >= size_t(max_state))) {
			THROW_STD(length_error,
				"state arena exhausted: total_states=%zd max_state=%zd",
				s, size_t(max_state));
		}
		assert(len <= size_t(state_t::max_len));
		states.push_back();
		states[s].len = state_id_t(len);
		return state_id_t(s);
	}

	/// new state with copied moves and link of src, len is set by caller
	state_id_t clone_state(state_id_t src, size_t len) {
		assert(src < states.size());
		state_id_t s = new_state(len);
		// copy after push_back, states may be realloc'ed by new_state
		states[s].moves = states[src].moves;
		states[s].link = states[src].link;
		states[s].b_clone = 1;
		transition_num += states[s].moves.size();
		return s;
	}

	const state_t& get(state_id_t s) const {
		assert(s < states.size());
		return states[s];
	}
	state_t& get(state_id_t s) {
		assert(s < states.size());
		return states[s];
	}
	const state_t& operator[](state_id_t s) const { return get(s); }
	state_t& operator[](state_id_t s) { return get(s); }

	state_id_t state_move(state_id_t s, Symbol ch) const {
		assert(s < states.size());
		const valvec<move_t>& t = states[s].moves;
		auto pos = std::lower_bound(t.begin(), t.end(), ch, ChLess());
		if (t.end() != pos && !(ch < pos->ch))
			return pos->target;
		return nil_state;
	}

	/// ch must not have a move in s
	void add_move(state_id_t s, state_id_t target, Symbol ch) {
		assert(s < states.size());
		assert(target < states.size());
		valvec<move_t>& t = states[s].moves;
		auto pos = std::lower_bound(t.begin(), t.end(), ch, ChLess());
		assert(t.end() == pos || ch < pos->ch);
		t.insert(pos, move_t(ch, target));
		transition_num++;
	}

	/// ch must already have a move in s
	void set_move(state_id_t s, state_id_t target, Symbol ch) {
		assert(s < states.size());
		assert(target < states.size());
		valvec<move_t>& t = states[s].moves;
		auto pos = std::lower_bound(t.begin(), t.end(), ch, ChLess());
		assert(t.end() != pos && !(ch < pos->ch));
		pos->target = target;
	}

	template<class OP>
	void for_each_move(state_id_t s, OP op) const {
		assert(s < states.size());
		for (const move_t& m : states[s].moves)
			op(m.target, m.ch);
	}

	size_t mem_size() const {
		size_t sz = sizeof(state_t) * states.capacity();
		for (size_t i = 0; i < states.size(); ++i)
			sz += sizeof(move_t) * states[i].moves.capacity();
		return sz;
	}
};

} // namespace sufauto
