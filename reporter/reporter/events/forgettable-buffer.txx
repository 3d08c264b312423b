namespace reporter
{
  template <typename T>
  typename basic_forgettable_buffer<T>::push_result basic_forgettable_buffer<T>::
  push (string_type l)
  {
    lines_.push_back (std::move (l));

    // While the window has room the line is simply printed below the
    // previous ones.
    //
    if (lines_.size () <= capacity_)
    {
      printed_ = lines_.size ();
      return push_result {false, 0};
    }

    // Overflow. Evict from the front and have the caller redraw the window
    // over what it printed so far.
    //
    while (lines_.size () > capacity_)
      lines_.pop_front ();

    push_result r {true, printed_};
    printed_ = lines_.size ();
    return r;
  }

  template <typename T>
  void basic_forgettable_buffer<T>::
  reset () noexcept
  {
    lines_.clear ();
    printed_ = 0;
  }
}
