#ifndef QSTORE_ITERATOR_H
#define QSTORE_ITERATOR_H


namespace qstore
{


/*
* This is an interface to an object which iterates over values
* of a generic type T.
* These iterators are initialised to be invalid.
* You can call `current` and `next` if and only if the iterator is `valid`.
* `start` can be called at any time to validate the iterator and restart it.
* Calling `next` will result in invalidating the iterator once the end is reached.
*/
template<typename T>
class IIterator
{
public:
	virtual ~IIterator() = default;

	virtual void start() = 0;  // post: points to first value, or `!valid()` if there is none
	virtual T current() const = 0;  // pre: `valid()`
	virtual void next() = 0;  // pre: `valid()`
	virtual bool valid() const = 0;
};


}  // namespace qstore


#endif  // QSTORE_ITERATOR_H
