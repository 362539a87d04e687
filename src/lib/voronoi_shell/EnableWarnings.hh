// Restore the warnings disabled by DisableWarnings.hh
#if defined(__clang__)
	#pragma clang diagnostic pop
#elif (defined(__GNUC__) || defined(__GNUG__)) && !(defined(__clang__) || defined(__INTEL_COMPILER))
	#pragma GCC diagnostic pop
#endif
