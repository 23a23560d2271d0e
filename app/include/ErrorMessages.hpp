#ifndef ERRORMESSAGES_H
#define ERRORMESSAGES_H

#include <libintl.h>

#define _(String) gettext(String)

#define MSG_SORT_CANCELLED _("Sorting cancelled")
#define MSG_SORT_STALLED _("Nothing was done in last {} seconds.")

#endif
