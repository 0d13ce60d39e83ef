#include "raopd/rrtext.hpp"

#include <string>

#ifdef HAVE_LDNS
#include <ldns/ldns.h>
#endif

namespace raopd
{
RrTextResult format_rr_text(Bytes wire)
{
    RrTextResult out{};

#ifndef HAVE_LDNS
    (void) wire;
    out.rc = -1;
    out.kind = RrTextErrorKind::NotAvailable;
    out.error =
            "ldns not available: rebuild with ldns (pkg-config ldns) to render records";
    return out;
#else
    ldns_rr *rr = nullptr;
    size_t pos = 0;
    ldns_status st = ldns_wire2rr(
        &rr,
        wire.data(),
        wire.size(),
        &pos,
        LDNS_SECTION_ANSWER);
    if (st != LDNS_STATUS_OK || !rr)
    {
        out.rc = -1;
        out.kind = RrTextErrorKind::ParseFailed;
        out.error = ldns_get_errorstr_by_id(st);
        if (rr) ldns_rr_free(rr);
        return out;
    }

    if (char *s = ldns_rr2str(rr))
    {
        out.text = s;
        LDNS_FREE(s);
    }
    while (!out.text.empty() && (out.text.back() == '\n' || out.text.back() == ' '))
    {
        out.text.pop_back();
    }

    out.rc = 0;
    ldns_rr_free(rr);
    return out;
#endif
}
} // namespace raopd
