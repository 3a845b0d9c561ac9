/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   definitions used in all programs, helper functions
*/

#ifndef UMKV_COMMON_COMMON_H
#define UMKV_COMMON_COMMON_H

#if defined(HAVE_LIBINTL_H)
# include <libintl.h>
# if !defined Y
#  define Y(s) gettext(s)
#  define NY(s_singular, s_plural, count) ngettext(s_singular, s_plural, count)
# endif
#else /* HAVE_LIBINTL_H */
# if !defined Y
#  define Y(s) (s)
#  define NY(s_singular, s_plural, count) ((count) == 1 ? (s_singular) : (s_plural))
# endif
#endif

#include "common/debugging.h"
#include "common/output.h"

#define MXMSG_ERROR    5
#define MXMSG_WARNING 10
#define MXMSG_INFO    15

#define isblanktab(c) (((c) == ' ')  || ((c) == '\t'))
#define iscr(c)       (((c) == '\n') || ((c) == '\r'))

#define map_has_key(m, k) ((m).end() != (m).find(k))

// Without an explicit code the exit code is 1 if a warning was issued
// and 0 otherwise.
void mxexit(int code = -1);

extern unsigned int verbose;

// Installs the console message handlers, reads UNLINKMKV_DEBUG and
// initializes the translations.
void umkv_common_init(char const *argv0 = nullptr);

#endif // UMKV_COMMON_COMMON_H
