//! # docmd Entry Point
//!
//! Converts documentation comment text to Markdown.
//!
//! ```bash
//! docmd Foo.javadoc                         # render a file
//! echo '{@code x} is <b>bold</b>' | docmd   # render stdin
//! docmd --signature='int size()' doc.txt    # render as a hover
//! ```
//!
//! All work happens in `docmd_main()` (`cli/driver.cpp`).

#include "driver.hpp"

int main(int argc, char* argv[]) {
    return docmd_main(argc, argv);
}
