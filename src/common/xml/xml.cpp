/*
   unlinkmkv -- utility for undoing segment linking in Matroska files

   Distributed under the GPL
   see the file COPYING for details
   or visit http://www.gnu.org/copyleft/gpl.html

   XML helper functions
*/

#include "common/common_pch.h"

#include <sstream>

#include "common/xml/xml.h"

namespace umkv {
namespace xml {

document_cptr
load_string(std::string const &content,
            unsigned int options) {
  auto doc    = std::make_shared<pugi::xml_document>();
  auto result = doc->load_buffer(content.data(), content.size(), options, pugi::encoding_auto);
  if (!result)
    throw xml_parser_x{result};

  return doc;
}

// Always written as UTF-8 with an explicit encoding in the declaration;
// a declaration present in the document is replaced.
std::string
serialize(pugi::xml_document const &doc) {
  std::stringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

  for (auto const &node : doc.children())
    if (node.type() != pugi::node_declaration)
      node.print(out, "  ", pugi::format_indent, pugi::encoding_utf8);

  return out.str();
}

void
remove_children(pugi::xml_node &parent,
                char const *name) {
  while (auto child = parent.child(name))
    parent.remove_child(child);
}

}}
