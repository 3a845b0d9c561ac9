/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   class definitions for the error exception class
*/

#ifndef UMKV_COMMON_ERROR_H
#define UMKV_COMMON_ERROR_H

#include <exception>
#include <string>

namespace umkv {
  class exception: public std::exception {
  public:
    virtual const char *what() const throw() {
      return "unspecified unlinkmkv error";
    }

    virtual std::string error() const throw() {
      return what();
    }
  };

  class invalid_parameter_x: public exception {
  public:
    virtual const char *what() const throw() {
      return "invalid parameter in function call";
    }
  };
}

#endif // UMKV_COMMON_ERROR_H
