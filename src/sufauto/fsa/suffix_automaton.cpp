#include "suffix_automaton_impl.hpp"

namespace sufauto {

static long g_debugLevel = terark::getEnvLong("SufAuto_debugLevel", 0);
static bool g_verifyOnFinalize = terark::getEnvBool("SufAuto_verifyOnFinalize", false);

long SamDebugLevel() { return g_debugLevel; }
bool SamVerifyOnFinalize() { return g_verifyOnFinalize; }

template class SuffixAutomaton<byte_t, uint32_t>;
template class SuffixAutomaton<byte_t, uint64_t>;
template class SuffixAutomaton<uint32_t, uint32_t>;

} // namespace sufauto
