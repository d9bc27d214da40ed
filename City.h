#ifndef CITY_H
#define CITY_H

class City {
private:
    int id;     // ID tal como aparece en el archivo (base 1)
    double x;
    double y;

public:
    // Constructores
    City();
    City(int id, double x, double y);

    // Getters
    int getId() const;
    double getX() const;
    double getY() const;

    // Destructor
    ~City();
};

#endif // CITY_H
