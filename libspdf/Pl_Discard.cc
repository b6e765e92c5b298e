#include <spdf/Pl_Discard.hh>

Pl_Discard::Pl_Discard() :
    Pipeline("discard", nullptr)
{
}

Pl_Discard::~Pl_Discard() = default;

void
Pl_Discard::write(unsigned char const*, size_t)
{
}

void
Pl_Discard::finish()
{
}
