#include "Cell.hpp"

Cell::Cell(int x, int y) :
	x_(x),
	y_(y),
	mine_(false),
	trap_(false),
	cursed_(false),
	uncovered_(false),
	flag_(false),
	mines_in_vicinity_(0)
{
}

void Cell::Uncover()
{
	uncovered_ = true;
}
