/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   XML helper functions
*/

#ifndef UMKV_COMMON_XML_H
#define UMKV_COMMON_XML_H

#include "common/common_pch.h"

#include <pugixml.hpp>

namespace umkv {
namespace xml {

class exception: public umkv::exception {
public:
  virtual const char *what() const throw() {
    return "generic XML error";
  }
};

class xml_parser_x: public exception {
protected:
  pugi::xml_parse_result m_result;
public:
  xml_parser_x(pugi::xml_parse_result const &result) : m_result(result) { }
  virtual const char *what() const throw() {
    return "XML parser error";
  }
  virtual std::string error() const throw() {
    return (boost::format(Y("XML parser error at position %1%: %2%")) % m_result.offset % m_result.description()).str();
  }
  pugi::xml_parse_result const &result() {
    return m_result;
  }
};

typedef std::shared_ptr<pugi::xml_document> document_cptr;

document_cptr load_string(std::string const &content, unsigned int options = pugi::parse_default);

std::string serialize(pugi::xml_document const &doc);

void remove_children(pugi::xml_node &parent, char const *name);

}}
#endif  // UMKV_COMMON_XML_H
