#ifndef CELL_HPP
#define CELL_HPP

class Cell
{
public:
	int x_;
	int y_;

	bool mine_;
	bool trap_;
	bool cursed_;
	bool uncovered_;
	bool flag_;
	int mines_in_vicinity_;

	Cell(int x, int y);

	void Uncover();
};

#endif
