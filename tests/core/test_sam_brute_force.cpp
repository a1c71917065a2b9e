// Compare the automaton against brute force on every string over small
// alphabets, each prefix is rebuilt from scratch, so a wrong step of
// extend shows up at the first text it breaks.
#include <sufauto/fsa/suffix_automaton.hpp>
#include <terark/util/function.hpp>
#include <terark/util/profiling.hpp>
#include <stdio.h>
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace sufauto;

static size_t g_checked_texts = 0;

typedef std::map<std::string, size_t> SubstrCount;

static void brute_force(const std::string& text, SubstrCount* cnt) {
	cnt->clear();
	for (size_t i = 0; i < text.size(); ++i)
		for (size_t j = i + 1; j <= text.size(); ++j)
			(*cnt)[text.substr(i, j - i)]++;
}

static bool ends_with(const std::string& text, const std::string& s) {
	return s.size() <= text.size() &&
		text.compare(text.size() - s.size(), s.size(), s) == 0;
}

static void check_text(const std::string& text, const std::vector<std::string>& patterns) {
	SubstrCount cnt;
	brute_force(text, &cnt);
	ByteSuffixAutomaton sam;
	sam.extend(text);
	size_t n = text.size();
	TERARK_VERIFY_EQ(sam.text_length(), n);
	TERARK_VERIFY_EQ(sam.count_distinct_substrings(), cnt.size());
	if (n >= 2)
		TERARK_VERIFY_LE(sam.total_states(), 2*n - 1);
	if (n >= 3)
		TERARK_VERIFY_LE(sam.total_transitions(), 3*n - 4);
	sam.verify();

	// mutable phase: lazy endpos counts
	for (auto& kv : cnt) {
		TERARK_VERIFY(sam.contains_substring(kv.first));
		TERARK_VERIFY_EQ(sam.occurrence_count(kv.first), kv.second);
		TERARK_VERIFY_EQ(sam.match_prefix_length(kv.first), kv.first.size());
	}
	for (const std::string& q : patterns) {
		bool found = cnt.count(q) != 0;
		TERARK_VERIFY_EQ(sam.contains_substring(q), found);
		if (!found) {
			TERARK_VERIFY_EQ(sam.occurrence_count(q), 0);
			TERARK_VERIFY_LT(sam.match_prefix_length(q), q.size());
		}
	}

	sam.finalize();
	sam.verify();
	TERARK_VERIFY(sam.is_suffix(""));
	for (auto& kv : cnt) {
		TERARK_VERIFY_EQ(sam.is_suffix(kv.first), ends_with(text, kv.first));
		TERARK_VERIFY_EQ(sam.occurrence_count(kv.first), kv.second);
	}

	// finalize is idempotent
	std::string term1, term2;
	for (size_t i = 0; i < sam.total_states(); ++i)
		term1.push_back('0' + sam.arena()[uint32_t(i)].b_term);
	sam.finalize();
	for (size_t i = 0; i < sam.total_states(); ++i)
		term2.push_back('0' + sam.arena()[uint32_t(i)].b_term);
	TERARK_VERIFY(term1 == term2);
	g_checked_texts++;
}

// all strings of length 1..3 over alphabet plus one unseen symbol
static void make_patterns(const std::string& alphabet, std::vector<std::string>* patterns) {
	std::string ext = alphabet + '#';
	patterns->clear();
	patterns->push_back(std::string());
	for (size_t i = 0; i < patterns->size(); ++i) {
		if ((*patterns)[i].size() == 3)
			continue;
		for (char c : ext)
			patterns->push_back((*patterns)[i] + c);
	}
	patterns->erase(patterns->begin()); // the empty one
}

static void for_each_text(std::string& text, const std::string& alphabet,
						  const std::vector<std::string>& patterns, size_t maxlen) {
	check_text(text, patterns);
	if (text.size() == maxlen)
		return;
	for (char c : alphabet) {
		text.push_back(c);
		for_each_text(text, alphabet, patterns, maxlen);
		text.pop_back();
	}
}

static void test_exhaustive() {
	struct { const char* alphabet; size_t maxlen; } cases[] = {
		{ "a"   , 16 },
		{ "ab"  , 11 },
		{ "abc" ,  8 },
		{ "abcd",  8 },
	};
	for (auto& c : cases) {
		std::string text;
		std::vector<std::string> patterns;
		make_patterns(c.alphabet, &patterns);
		size_t before = g_checked_texts;
		for_each_text(text, c.alphabet, patterns, c.maxlen);
		printf("alphabet=%-4s maxlen=%2zd texts=%zd\n", c.alphabet, c.maxlen,
			   g_checked_texts - before);
	}
}

// longer random texts, occurrence counts by naive search
static void test_random() {
	std::mt19937 rng(12345);
	const std::string alphabet = "abc";
	for (int round = 0; round < 50; ++round) {
		size_t n = 50 + rng() % 250;
		std::string text;
		for (size_t i = 0; i < n; ++i)
			text.push_back(alphabet[rng() % alphabet.size()]);
		SubstrCount cnt;
		brute_force(text, &cnt);
		ByteSuffixAutomaton sam;
		sam.extend(text);
		TERARK_VERIFY_EQ(sam.count_distinct_substrings(), cnt.size());
		sam.finalize();
		sam.verify();
		for (int k = 0; k < 200; ++k) {
			size_t len = 1 + rng() % 12;
			std::string q;
			for (size_t i = 0; i < len; ++i)
				q.push_back(alphabet[rng() % alphabet.size()]);
			size_t naive = 0;
			for (size_t pos = text.find(q); pos != std::string::npos; pos = text.find(q, pos + 1))
				naive++;
			TERARK_VERIFY_EQ(sam.occurrence_count(q), naive);
			TERARK_VERIFY_EQ(sam.contains_substring(q), naive != 0);
			TERARK_VERIFY_EQ(sam.is_suffix(q), ends_with(text, q));
		}
	}
}

int main() {
	terark::profiling pf;
	long long t0 = pf.now();
	test_exhaustive();
	test_random();
	long long t1 = pf.now();
	printf("test_sam_brute_force passed: %zd texts, time=%f's\n",
		   g_checked_texts, pf.sf(t0, t1));
	return 0;
}
