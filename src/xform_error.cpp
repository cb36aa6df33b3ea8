/*
 * Contract violation reporting for the rewriting engine.
 *
 * (c) Copyright Clifford Heath 2025. See LICENSE file for usage rights.
 */
#include	<stdio.h>
#include	<stdlib.h>

#include	<atomic>
#include	<xform_error.h>

static void
default_contract_handler(const char* message)
{
	fprintf(stderr, "xformpp: contract violation: %s\n", message);
	fflush(stderr);
	abort();
}

static	std::atomic<XformContractHandler>	contract_handler(default_contract_handler);

XformContractHandler
XformSetContractHandler(XformContractHandler handler)
{
	if (!handler)
		handler = default_contract_handler;
	return contract_handler.exchange(handler);
}

void
XformContractViolation(const char* message)
{
	XformContractHandler	handler = contract_handler;
	handler(message);
}
