#include "tree.hpp"

namespace smb2 {

Header BasicTree::stamp_common_header_fields(Header header) const {
    header.tree_id    = tree_id_;
    header.session_id = session_id_;
    return header;
}

}  // namespace smb2
