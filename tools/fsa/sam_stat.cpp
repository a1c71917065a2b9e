#include <sufauto/fsa/suffix_automaton.hpp>
#include <terark/util/linebuf.hpp>
#include <terark/util/profiling.hpp>
#include <terark/util/autoclose.hpp>
#include <getopt.h>
#include <errno.h>
#include <string.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sufauto;

void usage(const char* prog) {
	fprintf(stderr, R"EOS(Usage:
   %s Options [Input-Text-File]

Description:
   Build suffix automaton of the text in Input-Text-File, if Input-Text-File
   is omitted, use stdin. Lines are concatenated into one text, line feeds
   are dropped unless -n is specified.

Options:
   -q Pattern
      Query Pattern, can be specified multiple times, for each Pattern print:
      contains_substring, is_suffix, occurrence_count, match_prefix_length
   -n Keep line feeds in the text
   -v Verify automaton structure after finalize
   -p Print all states to stdout
   -h Show this help

Environment:
   SufAuto_debugLevel       : 1 finalize stat, 2 clones, 3 every extend
   SufAuto_verifyOnFinalize : run verify in finalize
)EOS"
		, prog);
}

terark::profiling pf;

const char* finput_name = NULL;
bool keep_newline = false;
bool verify_struct = false;
bool print_states = false;
std::vector<std::string> patterns;

int main(int argc, char* argv[]) {
	for (;;) {
		int opt = getopt(argc, argv, "q:nvph");
		switch (opt) {
		case -1:
			goto GetoptDone;
		case 'q':
			patterns.push_back(optarg);
			break;
		case 'n':
			keep_newline = true;
			break;
		case 'v':
			verify_struct = true;
			break;
		case 'p':
			print_states = true;
			break;
		case 'h':
			usage(argv[0]);
			return 0;
		default:
			usage(argv[0]);
			return 1;
		}
	}
GetoptDone:
	if (optind < argc) {
		finput_name = argv[optind];
	}
	terark::Auto_fclose finput;
	if (finput_name) {
		finput = fopen(finput_name, "r");
		if (NULL == finput) {
			fprintf(stderr, "failed: fopen(%s, r) = %s\n", finput_name, strerror(errno));
			return 3;
		}
	}
	ByteSuffixAutomaton sam;
	long long t0 = 0, t1 = 0, t2 = 0;
	try {
		t0 = pf.now();
		terark::LineBuf line;
		long lineno = 0;
		while (line.getline(finput.self_or(stdin)) >= 0) {
			lineno++;
			if (!keep_newline)
				line.chomp();
			sam.extend(fstring(line.p, line.n));
			if (lineno % 100000 == 0) {
				printf("lineno=%ld, SAM[text_length=%zd states=%zd transitions=%zd]\n"
					, lineno, sam.text_length(), sam.total_states(), sam.total_transitions());
			}
		}
		t1 = pf.now();
		sam.finalize();
		if (verify_struct)
			sam.verify();
		t2 = pf.now();
	}
	catch (const std::exception& ex) {
		fprintf(stderr, "failed: text_length=%zd: %s\n", sam.text_length(), ex.what());
		return 1;
	}
	printf("text_length         : %11zd\n", sam.text_length());
	printf("total_states        : %11zd\n", sam.total_states());
	printf("total_transitions   : %11zd\n", sam.total_transitions());
	printf("distinct_substrings : %11zd\n", sam.count_distinct_substrings());
	printf("mem_size            : %11zd\n", sam.mem_size());
	printf("time: extend=%f's finalize=%f's\n", pf.sf(t0,t1), pf.sf(t1,t2));
	if (sam.text_length() > 0) {
		printf("speed: %f MB/s, %f ns/symbol\n"
			, sam.text_length()/pf.uf(t0,t1)
			, pf.uf(t0,t1)*1000/sam.text_length());
	}
	for (const std::string& q : patterns) {
		printf("pattern[%s]: contains=%d suffix=%d occurrences=%zd prefix_match=%zd\n"
			, q.c_str()
			, sam.contains_substring(q)
			, sam.is_suffix(q)
			, sam.occurrence_count(q)
			, sam.match_prefix_length(q)
			);
	}
	if (print_states)
		sam.print_states(stdout);
	return 0;
}
