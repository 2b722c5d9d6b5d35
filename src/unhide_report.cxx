
#include "unhide_report.hxx"

#define C_RESET "\033[0;37m"
#define C_BOLD "\033[1;37m"
#define C_TEXT "\033[0;97m"
#define C_GREEN "\033[1;32m"
#define C_BLUE "\033[1;34m"
#define C_RED "\033[1;31m"
#define C_GREY "\033[1;30m"
#define C_YELLOW "\033[0;93m"

static const char banner_art[] =
	"                                                              /%(\n"
	"                               -= Find NTLMv2 =-          ,@@@@@@@@&\n"
	"           /%&@@@@&,            -= hashes w/ =-          %@@@@@@@@@@@*\n"
	"         (@@@@@@@@@@@(       -=    ntlmunhide    =-    *@@@@@@@@@@@@@@@.\n"
	"        &@@@@@@@@@@@@@@&.                             @@@@@@@@@@@@@@@@@@(\n"
	"      ,@@@@@@@@@@@@@@@@@@@/                        .%@@@@@@@@@@@@@@@@@@@@@\n"
	"     /@@@@@@@#&@&*.,/@@@@(.                            ,%@@@@&##(%@@@@@@@@@.\n"
	"    (@@@@@@@(##(.         .#&@%%(                .&&@@&(            ,/@@@@@@#\n"
	"   %@@@@@@&*/((.         #(                           ,(@&            ,%@@@@@@*\n"
	"  @@@@@@@&,/(*                                           ,             .,&@@@@@#\n"
	" @@@@@@@/*//,                                                            .,,,**\n"
	"   .,,  ...\n"
	"                                    .#@@@@@@@(.\n"
	"                                   /@@@@@@@@@@@&\n"
	"                                   .@@@@@@@@@@@*\n"
	"                                     .(&@@@%/.  ..\n"
	"                               (@@&     %@@.   .@@@,\n"
	"                          /@@#          @@@,         %@&\n"
	"                               &@@&.    @@@/    @@@#\n"
	"                          .    %@@@(   ,@@@#    @@@(     ,\n"
	"                         *@@/         .@@@@@(          #@%\n"
	"                          *@@%.      &@@@@@@@@,      /@@@.\n"
	"                           .@@@@@@@@@@@&. .*@@@@@@@@@@@/.\n"
	"                              .%@@@@%,        /%@@@&(.\n";

void x_unhide_report_t::banner()
{
	if (quiet) {
		return;
	}
	fprintf(out, "%s%s\n%s\n", c(C_YELLOW), banner_art, c(C_TEXT));
}

void x_unhide_report_t::usage(const char *progname)
{
	fprintf(out, "%s\nusage: %s -i <inputfile> [-o <outputfile>] [-f] [-h] [-q] [-v]\n"
			"       [-c <configfile>] [-O name=value]... [-V]\n%s\n",
			c(C_BOLD), progname, c(C_TEXT));
}

void x_unhide_report_t::searching(const std::string &input,
		const std::string &output)
{
	if (quiet) {
		return;
	}
	fprintf(out, "%sSearching %s for NTLMv2 hashes...\n", c(C_BOLD),
			input.c_str());
	if (!output.empty()) {
		fprintf(out, "Writing output to: %s\n", output.c_str());
	}
	fprintf(out, "%s\n", c(C_TEXT));
}

void x_unhide_report_t::found(const x_ntlmssp_occurrence_t &occ)
{
	fprintf(out, "%sFound NTLMSSP Message Type %u :%s %s%s",
			c(C_BOLD), occ.raw_type, c(C_GREEN),
			x_ntlmssp_type_name(occ.type), c(C_RESET));
	if (verbose) {
		fprintf(out, "    %s>%s Offset %zu%s", c(C_GREY), c(C_RESET),
				occ.offset, c(C_RESET));
	}
	fputc('\n', out);
}

void x_unhide_report_t::field(const char *name, const std::string &text,
		const x_ntlmssp_field_t &field)
{
	fprintf(out, "    %s>%s %-22s :%s %s%s\n", c(C_BLUE), c(C_BOLD),
			name, c(C_TEXT), text.c_str(), c(C_RESET));
	if (verbose) {
		if (!field.present) {
			fprintf(out, "      %-22s : past end of data\n",
					(std::string(name) + " descriptor").c_str());
		} else {
			fprintf(out, "      %-22s : %u\n",
					(std::string(name) + " length").c_str(),
					field.length);
			fprintf(out, "      %-22s : %u\n",
					(std::string(name) + " offset").c_str(),
					field.offset);
			if (!field.valid) {
				fprintf(out, "      %-22s : past end of data\n", name);
			}
		}
		fputc('\n', out);
	}
}

void x_unhide_report_t::authenticate(const x_ntlmssp_result_t &result)
{
	const x_ntlmssp_auth_t &auth = *result.auth;
	field("Domain", auth.domain, auth.domain_field);
	field("Username", auth.username, auth.user_field);
	field("Workstation", auth.workstation, auth.workstation_field);

	if (verbose) {
		const x_ntlmssp_field_t &nt = auth.nt_response_field;
		fprintf(out, "      NTLM length            : %u\n", nt.length);
		fprintf(out, "      NTLM offset            : %u\n", nt.offset);
		fprintf(out, "    %s>%s NTProofStr             :%s %s\n",
				c(C_BLUE), c(C_BOLD), c(C_RESET),
				x_hex_encode(auth.nt_proof_str.data(),
					auth.nt_proof_str.size()).c_str());
		fprintf(out, "    %s>%s NTLMv2 Response        :%s %s\n",
				c(C_BLUE), c(C_BOLD), c(C_RESET),
				x_hex_encode(auth.ntlmv2_response.data(),
					auth.ntlmv2_response.size()).c_str());
	}
	fputc('\n', out);

	if (!result.challenge) {
		fprintf(out, "%sServer Challenge not found... can't create crackable hash :-/%s\n\n",
				c(C_RED), c(C_RESET));
		return;
	}

	fprintf(out, "%sNTLMv2 Hash recovered:%s\n", c(C_BOLD), c(C_TEXT));
	switch (result.outcome) {
	case x_ntlmssp_outcome_t::null_session:
		fprintf(out, "%sNTLM NULL session found... no hash to generate%s\n",
				c(C_RESET), c(C_RESET));
		break;
	case x_ntlmssp_outcome_t::truncated:
		fprintf(out, "%sMessage truncated... no hash to generate%s\n",
				c(C_RED), c(C_RESET));
		break;
	case x_ntlmssp_outcome_t::short_response:
		fprintf(out, "%sNot an NTLMv2 response... no hash to generate%s\n",
				c(C_RED), c(C_RESET));
		break;
	case x_ntlmssp_outcome_t::hash:
		fprintf(out, "%s\n", result.hash.c_str());
		break;
	default:
		X_ASSERT(false);
	}
	fputc('\n', out);
}

void x_unhide_report_t::result(const x_ntlmssp_result_t &result)
{
	if (quiet) {
		if (result.outcome == x_ntlmssp_outcome_t::hash) {
			fprintf(out, "%s\n", result.hash.c_str());
			fflush(out);
		}
		return;
	}

	const x_ntlmssp_occurrence_t &occ = result.occurrence;
	switch (occ.type) {
	case x_ntlmssp_type_t::negotiate:
		found(occ);
		fputc('\n', out);
		break;
	case x_ntlmssp_type_t::challenge:
		found(occ);
		if (result.challenge) {
			fprintf(out, "    %s>%s Server Challenge       :%s %s%s\n",
					c(C_BLUE), c(C_BOLD), c(C_TEXT),
					x_hex_encode(result.challenge->data(),
						result.challenge->size()).c_str(),
					c(C_RESET));
		} else {
			fprintf(out, "    %s>%s Server Challenge       :%s past end of data%s\n",
					c(C_BLUE), c(C_BOLD), c(C_RED), c(C_RESET));
		}
		fputc('\n', out);
		break;
	case x_ntlmssp_type_t::authenticate:
		found(occ);
		authenticate(result);
		break;
	default:
		if (verbose) {
			found(occ);
			fputc('\n', out);
		}
		break;
	}
	fflush(out);
}

void x_unhide_report_t::bye()
{
	fprintf(out, "Bye!\n");
	fflush(out);
}

